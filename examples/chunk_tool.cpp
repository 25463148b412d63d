/**
 * @file chunk_tool.cpp
 * @brief Build a chunk from a message, or list the chunks of a raw chunk stream
 *
 * Usage:
 *   chunk_tool <type> <message>   encode and print a chunk
 *   chunk_tool --dump <file>      list back-to-back chunk records in a file
 *
 * The dump mode expects the file to start with a chunk record; for a PNG
 * file, strip the 8-byte signature first.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {
    void print_hex(const std::vector<std::byte>& bytes) {
        auto flags = std::cout.flags();
        for (std::size_t i = 0; i < bytes.size(); i++) {
            std::cout << std::hex << std::setfill('0') << std::setw(2)
                      << std::to_integer<unsigned>(bytes[i]);
            std::cout << (((i + 1) % 16 == 0 || i + 1 == bytes.size()) ? '\n' : ' ');
        }
        std::cout.flags(flags);
    }

    int encode(const std::string& type_text, const std::string& message) {
        auto type = pngchunk::chunk_type::from_string(type_text);
        pngchunk::chunk c(type, std::string_view(message));

        std::cout << c << "\n\n";
        std::cout << "critical: " << std::boolalpha << type.is_critical()
                  << ", public: " << type.is_public()
                  << ", safe to copy: " << type.is_safe_to_copy() << "\n\n";
        print_hex(c.to_bytes());
        return 0;
    }

    int dump(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file '" << filename << "'\n";
            return 1;
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        std::transform(raw.begin(), raw.end(), data.begin(), [](char c) { return std::byte(c); });

        pngchunk::parse_options options;
        options.strict = false;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        std::cout << "Chunks in: " << filename << "\n";
        std::cout << "====================\n\n";

        pngchunk::for_each_chunk(data, [](const pngchunk::chunk& c, std::size_t offset) {
            std::cout << std::setw(8) << offset << "  " << c.type()
                      << "  " << c.length() << " bytes"
                      << (c.type().is_critical() ? "  critical" : "") << "\n";
        }, options);
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cout << "Usage: " << argv[0] << " <type> <message>\n";
        std::cout << "       " << argv[0] << " --dump <file>\n";
        return 1;
    }

    try {
        if (std::string(argv[1]) == "--dump") {
            return dump(argv[2]);
        }
        return encode(argv[1], argv[2]);
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
