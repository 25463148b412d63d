//
// Table driven CRC-32, see the sample code in the PNG specification, Annex D
//

#include <pngchunk/crc32.hh>

#include <array>

namespace pngchunk {

    namespace {
        constexpr std::uint32_t crc_polynomial = 0xEDB88320u;

        constexpr std::array<std::uint32_t, 256> make_crc_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t n = 0; n < 256; n++) {
                std::uint32_t c = n;
                for (int k = 0; k < 8; k++) {
                    if (c & 1) {
                        c = crc_polynomial ^ (c >> 1);
                    } else {
                        c = c >> 1;
                    }
                }
                table[n] = c;
            }
            return table;
        }

        constexpr auto crc_table = make_crc_table();

        static_assert(crc_table[1] == 0x77073096u, "CRC table generated incorrectly");
        static_assert(crc_table[255] == 0x2D02EF8Du, "CRC table generated incorrectly");
    }

    std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t size) noexcept {
        auto p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < size; i++) {
            crc = crc_table[(crc ^ p[i]) & 0xFF] ^ (crc >> 8);
        }
        return crc;
    }

    std::uint32_t crc32(const void* data, std::size_t size) noexcept {
        return update_crc32(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
    }

    std::uint32_t crc32(const chunk_type::bytes_type& type_bytes,
                        const std::byte* payload, std::size_t size) noexcept {
        std::uint32_t crc = update_crc32(0xFFFFFFFFu, type_bytes.data(), type_bytes.size());
        crc = update_crc32(crc, payload, size);
        return crc ^ 0xFFFFFFFFu;
    }
}
