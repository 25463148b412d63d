/**
 * @file chunk.hh
 * @brief Length-prefixed, CRC-protected chunk record
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One chunk record: type, payload and CRC
     *
     * On the wire a chunk is laid out as
     * @code
     *   length  4 bytes, big-endian, payload byte count
     *   type    4 bytes
     *   payload length bytes
     *   crc     4 bytes, big-endian, CRC-32 of type and payload
     * @endcode
     *
     * A chunk object always holds a CRC that matches its type and payload:
     * the constructors compute it and parse() refuses records where the
     * stored value disagrees. Chunks are never modified after construction.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = 4;
        static constexpr std::size_t crc_field_size = 4;
        /// Bytes in a record besides the payload
        static constexpr std::size_t overhead = length_field_size + type_field_size + crc_field_size;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type, stored as given
         * @param data Payload bytes
         * @throws std::length_error if the payload does not fit a 32-bit length
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk from a raw byte range
         *
         * data may be null only when size is 0.
         *
         * @throws std::invalid_argument if data is null and size is not 0
         * @throws std::length_error if size does not fit a 32-bit length
         */
        chunk(const chunk_type& type, const void* data, std::size_t size);

        /**
         * @brief Convenience constructor for text payloads
         */
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief Parse one record from the start of a buffer
         *
         * Bytes after the record are left alone; use serialized_size() to
         * find the next record.
         *
         * @param data Buffer start
         * @param size Buffer size in bytes
         * @param options Size limit and warning callback
         * @return The parsed chunk
         * @throws truncated_error if the buffer ends inside the record
         * @throws invalid_tag_error if the type is not a valid chunk type
         * @throws parse_error if the declared length exceeds options.max_chunk_size
         * @throws crc_mismatch_error if the stored CRC is wrong
         */
        static chunk parse(const std::byte* data, std::size_t size, const parse_options& options);
        static chunk parse(const std::byte* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& buffer, const parse_options& options);
        static chunk parse(const std::vector<std::byte>& buffer);

        /**
         * @brief Payload length, taken from the payload itself
         */
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /**
         * @brief Payload viewed as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize as length, type, payload, crc
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Size of the record produced by to_bytes()
         */
        [[nodiscard]] std::size_t serialized_size() const { return overhead + m_data.size(); }

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length_field, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length_field;   // persisted length, equal to m_data.size()
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    // Multi-line debug view
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @brief Check whether a byte range is well-formed UTF-8
     *
     * Rejects overlong forms, surrogates and code points above U+10FFFF.
     */
    PNGCHUNK_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);

} // namespace pngchunk
