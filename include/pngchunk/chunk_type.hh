/**
 * @file chunk_type.hh
 * @brief Four-byte chunk type tag with case-encoded property bits
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk_type
     * @brief Chunk type tag such as "IHDR" or "tEXt"
     *
     * The four bytes are the only state. Each property is the case of one
     * byte (bit 5 of the ASCII letter):
     *   - byte 0: uppercase means critical, lowercase means ancillary
     *   - byte 1: uppercase means public, lowercase means private
     *   - byte 2: reserved, must be uppercase
     *   - byte 3: lowercase means safe to copy
     *
     * The constructors store any bytes unchanged so that tags found in
     * untrusted input can still be shown. from_bytes() and from_string()
     * are the validating entry points. The property predicates never
     * fail, even for invalid tags.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::byte, 4>;

        // Constructor from 4 individual chars, no validation
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ std::byte(c0), std::byte(c1), std::byte(c2), std::byte(c3) } {}

        constexpr chunk_type(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : m_bytes{ c0, c1, c2, c3 } {}

        constexpr explicit chunk_type(const bytes_type& bytes)
            : m_bytes(bytes) {}

        /**
         * @brief Validating constructor from raw bytes
         * @throws invalid_tag_error if a byte is not an ASCII letter or byte 2 is lowercase
         */
        static chunk_type from_bytes(const bytes_type& bytes);

        /**
         * @brief Validating constructor from text such as "IDAT"
         * @throws invalid_tag_error unless text is exactly 4 ASCII letters
         *         with an uppercase third letter
         */
        static chunk_type from_string(std::string_view text);

        [[nodiscard]] const bytes_type& bytes() const { return m_bytes; }

        // Each byte reinterpreted as a character
        [[nodiscard]] std::string to_string() const {
            std::string result(4, '\0');
            std::memcpy(result.data(), m_bytes.data(), 4);
            return result;
        }

        [[nodiscard]] bool is_valid() const {
            for (auto b : m_bytes) {
                if (!is_ascii_letter(b)) {
                    return false;
                }
            }
            return is_reserved_bit_valid();
        }

        [[nodiscard]] bool is_critical() const { return is_ascii_upper(m_bytes[0]); }
        [[nodiscard]] bool is_public() const { return is_ascii_upper(m_bytes[1]); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return is_ascii_upper(m_bytes[2]); }
        [[nodiscard]] bool is_safe_to_copy() const { return is_ascii_lower(m_bytes[3]); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        // Quoted tag, non-printable bytes escaped as \xNN
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (auto b : t.m_bytes) {
                auto c = std::to_integer<unsigned>(b);
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2) << c << std::dec;
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }

        static constexpr bool is_ascii_upper(std::byte b) {
            return b >= std::byte('A') && b <= std::byte('Z');
        }

        static constexpr bool is_ascii_lower(std::byte b) {
            return b >= std::byte('a') && b <= std::byte('z');
        }

        static constexpr bool is_ascii_letter(std::byte b) {
            return is_ascii_upper(b) || is_ascii_lower(b);
        }

    private:
        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Well-known types from the PNG specification
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
