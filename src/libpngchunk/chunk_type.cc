//
// chunk_type validation
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace {
        void check_tag(const chunk_type& t) {
            for (std::size_t i = 0; i < 4; i++) {
                THROW_INVALID_TAG_UNLESS(chunk_type::is_ascii_letter(t.bytes()[i]),
                    "Invalid chunk type ", t, ": byte ", i, " is not an ASCII letter");
            }
            THROW_INVALID_TAG_UNLESS(t.is_reserved_bit_valid(),
                "Invalid chunk type ", t, ": reserved bit (third letter) must be uppercase");
        }
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        chunk_type result(bytes);
        check_tag(result);
        return result;
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_INVALID_TAG_UNLESS(text.size() == 4,
            "Invalid chunk type '", text, "': expected 4 characters, got ", text.size());
        chunk_type result(text[0], text[1], text[2], text[3]);
        check_tag(result);
        return result;
    }
}
