#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Raw bytes of a string, without terminator
inline std::vector<std::byte> to_byte_vector(std::string_view s) {
    std::vector<std::byte> out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(std::byte(c));
    }
    return out;
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t value) {
    out.push_back(std::byte((value >> 24) & 0xFF));
    out.push_back(std::byte((value >> 16) & 0xFF));
    out.push_back(std::byte((value >> 8) & 0xFF));
    out.push_back(std::byte(value & 0xFF));
}

// Hand-built record: length, type, data and crc exactly as given
inline std::vector<std::byte> make_record(std::uint32_t length, std::string_view type,
                                          std::string_view data, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, length);
    auto t = to_byte_vector(type);
    out.insert(out.end(), t.begin(), t.end());
    auto d = to_byte_vector(data);
    out.insert(out.end(), d.begin(), d.end());
    append_be32(out, crc);
    return out;
}

inline const std::string secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u;
