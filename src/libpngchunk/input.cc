//
// Bounded reader over an in-memory byte buffer.
//

#include <cstring>

#include <pngchunk/endian.hh>
#include "input.hh"

namespace pngchunk {

    reader::reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(data ? size : 0), m_position(0) {}

    void reader::require(std::size_t count, const char* field) const {
        THROW_TRUNCATED_IF(remaining() < count,
            "Unexpected end of data reading ", field, " at offset ", m_position,
            ": need ", count, " bytes, only ", remaining(), " available");
    }

    std::vector<std::byte> reader::read_exact(std::size_t size, const char* field) {
        require(size, field);
        std::vector<std::byte> buffer(m_data + m_position, m_data + m_position + size);
        m_position += size;
        return buffer;
    }

    std::array<std::byte, 4> reader::read_tag(const char* field) {
        require(4, field);
        std::array<std::byte, 4> tag;
        std::memcpy(tag.data(), m_data + m_position, 4);
        m_position += 4;
        return tag;
    }

    std::uint32_t reader::read_be32(const char* field) {
        require(4, field);
        std::uint32_t value = load_be32(m_data + m_position);
        m_position += 4;
        return value;
    }
}
