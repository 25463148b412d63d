//
// Bounded reader over an in-memory byte buffer.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    // Reads forward through a buffer it does not own.
    // Every short read throws truncated_error naming the field being read.
    class reader {
        public:
            reader(const std::byte* data, std::size_t size);

            std::vector<std::byte> read_exact(std::size_t size, const char* field);
            std::array<std::byte, 4> read_tag(const char* field);
            std::uint32_t read_be32(const char* field);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            void require(std::size_t count, const char* field) const;

            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
