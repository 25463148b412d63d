//
// chunk construction, parsing and serialization
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

#include <cstring>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace pngchunk {

    namespace {
        std::uint32_t checked_length(std::size_t size) {
            if (static_cast<std::uint64_t>(size) > std::numeric_limits<std::uint32_t>::max()) {
                throw std::length_error(build_error_msg(
                    "Chunk payload of ", size, " bytes does not fit a 32-bit length field"));
            }
            return static_cast<std::uint32_t>(size);
        }

        std::vector<std::byte> copy_bytes(const void* data, std::size_t size) {
            auto p = static_cast<const std::byte*>(data);
            if (size == 0) {
                return {};
            }
            if (p == nullptr) {
                throw std::invalid_argument(build_error_msg(
                    "Null payload pointer with size ", size));
            }
            return std::vector<std::byte>(p, p + size);
        }

        // Number of continuation bytes and the range of the first one,
        // per the well-formed UTF-8 table of the Unicode standard
        struct utf8_lead {
            int continuation;
            unsigned char lo;
            unsigned char hi;
        };

        bool classify_lead(unsigned char c, utf8_lead& lead) {
            if (c >= 0xC2 && c <= 0xDF) {
                lead = {1, 0x80, 0xBF};
            } else if (c == 0xE0) {
                lead = {2, 0xA0, 0xBF};
            } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
                lead = {2, 0x80, 0xBF};
            } else if (c == 0xED) {
                lead = {2, 0x80, 0x9F};
            } else if (c == 0xF0) {
                lead = {3, 0x90, 0xBF};
            } else if (c >= 0xF1 && c <= 0xF3) {
                lead = {3, 0x80, 0xBF};
            } else if (c == 0xF4) {
                lead = {3, 0x80, 0x8F};
            } else {
                return false;
            }
            return true;
        }
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = std::to_integer<unsigned char>(data[i]);
            if (c < 0x80) {
                i++;
                continue;
            }

            utf8_lead lead{};
            if (!classify_lead(c, lead)) {
                return false;
            }
            if (size - i - 1 < static_cast<std::size_t>(lead.continuation)) {
                return false;
            }

            auto first = std::to_integer<unsigned char>(data[i + 1]);
            if (first < lead.lo || first > lead.hi) {
                return false;
            }
            for (int k = 2; k <= lead.continuation; k++) {
                auto next = std::to_integer<unsigned char>(data[i + k]);
                if (next < 0x80 || next > 0xBF) {
                    return false;
                }
            }
            i += 1 + lead.continuation;
        }
        return true;
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length_field(checked_length(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc32(m_type.bytes(), m_data)) {
    }

    chunk::chunk(const chunk_type& type, const void* data, std::size_t size)
        : chunk(type, copy_bytes(data, size)) {
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, text.data(), text.size()) {
    }

    chunk::chunk(std::uint32_t length_field, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length_field(length_field)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        reader in(data, size);

        const std::uint32_t length = in.read_be32("chunk length");

        const chunk_type type(in.read_tag("chunk type"));
        THROW_INVALID_TAG_UNLESS(type.is_valid(),
            "Invalid chunk type ", type, " in record of length ", length);

        THROW_LIMIT_IF(length > options.max_chunk_size,
            "Chunk ", type, " has size ", length,
            " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        auto payload = in.read_exact(length, "chunk data");
        const std::uint32_t stored_crc = in.read_be32("chunk CRC");

        const std::uint32_t actual_crc = crc32(type.bytes(), payload);
        if (stored_crc != actual_crc) {
            THROW_CRC_MISMATCH("CRC mismatch in chunk ", type, ": stored 0x",
                std::hex, std::setfill('0'), std::setw(8), stored_crc,
                ", computed 0x", std::setw(8), actual_crc);
        }

        if (in.remaining() > 0 && options.on_warning) {
            options.on_warning(in.tell(), "trailing_data",
                build_error_msg(in.remaining(), " bytes follow chunk ", type, " and were not parsed"));
        }

        return chunk(length, type, std::move(payload), stored_crc);
    }

    chunk chunk::parse(const std::byte* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& buffer, const parse_options& options) {
        return parse(buffer.data(), buffer.size(), options);
    }

    chunk chunk::parse(const std::vector<std::byte>& buffer) {
        return parse(buffer.data(), buffer.size(), parse_options{});
    }

    std::string chunk::data_as_string() const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            THROW_ENCODING("Data of chunk ", m_type, " is not valid UTF-8");
        }
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out(serialized_size());
        std::byte* p = out.data();

        store_be32(m_length_field, p);
        p += length_field_size;
        std::memcpy(p, m_type.bytes().data(), type_field_size);
        p += type_field_size;
        if (!m_data.empty()) {
            std::memcpy(p, m_data.data(), m_data.size());
            p += m_data.size();
        }
        store_be32(m_crc, p);

        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n";
        os << "  Length: " << c.length() << "\n";
        os << "  Type: " << c.type().to_string() << "\n";
        os << "  Data: ";
        if (is_valid_utf8(c.data().data(), c.data().size())) {
            os << c.data_as_string() << "\n";
        } else {
            os << "<not utf-8, " << c.length() << " bytes>\n";
        }
        os << "  Crc: " << c.crc() << "\n";
        os << "}";
        return os;
    }
}
