//
// Sequential traversal of back-to-back chunk records
//

#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size)
        : chunk_iterator(data, size, parse_options{}) {
    }

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options)
        : m_data(data)
        , m_size(data ? size : 0)
        , m_offset(0)
        , m_ended(false)
        , m_options(options)
        , m_record_options(options) {
        // Trailing data is expected between records, don't report it
        m_record_options.on_warning = nullptr;

        read_record();
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& buffer)
        : chunk_iterator(buffer.data(), buffer.size(), parse_options{}) {
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& buffer, const parse_options& options)
        : chunk_iterator(buffer.data(), buffer.size(), options) {
    }

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        m_offset += m_current->serialized_size();
        read_record();
    }

    void chunk_iterator::read_record() {
        while (true) {
            m_current.reset();

            if (m_offset >= m_size) {
                m_ended = true;
                return;
            }

            try {
                m_current.emplace(chunk::parse(m_data + m_offset, m_size - m_offset, m_record_options));
            } catch (const truncated_error&) {
                // The next record cannot be located
                m_ended = true;
                throw;
            } catch (const parse_error& e) {
                if (m_options.strict) {
                    m_ended = true;
                    throw;
                }
                skip_damaged(e);
                continue;
            }

            const chunk_type& type = m_current->type();
            if (type.is_critical() && !type.is_public() && m_options.on_warning) {
                m_options.on_warning(m_offset, "private_critical",
                    build_error_msg("Critical chunk ", type, " is private; readers may not understand it"));
            }
            return;
        }
    }

    void chunk_iterator::skip_damaged(const parse_error& e) {
        // Length and type were read before any of these errors, so the
        // length field is present and tells where the record ends
        const std::uint64_t length = load_be32(m_data + m_offset);
        const std::uint64_t total = chunk::overhead + length;
        if (total > m_size - m_offset) {
            m_ended = true;
            THROW_TRUNCATED("Damaged chunk at offset ", m_offset, " declares ", length,
                " data bytes but only ", m_size - m_offset, " bytes remain: ", e.what());
        }

        if (m_options.on_warning) {
            m_options.on_warning(m_offset, to_string(e.kind()),
                build_error_msg("Skipping chunk at offset ", m_offset, ": ", e.what()));
        }
        m_offset += static_cast<std::size_t>(total);
    }

    std::vector<chunk> parse_chunks(const std::vector<std::byte>& buffer, const parse_options& options) {
        std::vector<chunk> result;
        for_each_chunk(buffer, [&result](const chunk& c, std::size_t) {
            result.push_back(c);
        }, options);
        return result;
    }

    std::vector<chunk> parse_chunks(const std::vector<std::byte>& buffer) {
        return parse_chunks(buffer, parse_options{});
    }
}
