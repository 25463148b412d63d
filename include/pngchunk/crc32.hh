/**
 * @file crc32.hh
 * @brief CRC-32 as used by PNG chunks
 *
 * This is the ISO-HDLC CRC (the one zlib and PNG use): reflected
 * polynomial 0xEDB88320, register preset to 0xFFFFFFFF and complemented
 * at the end. A chunk's CRC covers its type bytes followed by its payload,
 * never the length field.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Feed bytes into a running CRC register
     * @param crc Current register value (start with 0xFFFFFFFF)
     * @param data Bytes to process
     * @param size Number of bytes
     * @return Updated register, not yet complemented
     */
    PNGCHUNK_EXPORT std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t size) noexcept;

    /**
     * @brief CRC-32 of a single buffer
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size) noexcept;

    /**
     * @brief CRC-32 of type bytes followed by payload
     * @param type_bytes The 4 chunk type bytes
     * @param payload Pointer to payload bytes (may be null when size is 0)
     * @param size Payload length
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const chunk_type::bytes_type& type_bytes,
                                        const std::byte* payload, std::size_t size) noexcept;

    inline std::uint32_t crc32(const chunk_type::bytes_type& type_bytes,
                               const std::vector<std::byte>& payload) noexcept {
        return crc32(type_bytes, payload.data(), payload.size());
    }
}
