/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Reason a chunk or chunk type could not be produced
     */
    enum class error_kind {
        invalid_tag,   ///< Tag bytes are not ASCII letters or the reserved bit is lowercase
        truncated,     ///< Buffer is shorter than the record it declares
        crc_mismatch,  ///< Stored CRC differs from the recomputed one
        not_utf8,      ///< Payload cannot be viewed as UTF-8 text
        limit          ///< Declared length exceeds parse_options::max_chunk_size
    };

    /**
     * @brief Name of an error kind, for diagnostics
     */
    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_tag:
                return "invalid_tag";
            case error_kind::truncated:
                return "truncated";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::not_utf8:
                return "not_utf8";
            case error_kind::limit:
                return "limit";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every codec error with a single catch block. The kind()
     * accessor tells which rule was violated.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class parse_error
     * @brief Exception for malformed chunk data
     *
     * Thrown when a byte buffer cannot be turned into a chunk or a
     * chunk type. No partially constructed object is ever returned.
     */
    class parse_error : public pngchunk_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngchunk_error(kind, msg) {}
    };

    class invalid_tag_error : public parse_error {
    public:
        explicit invalid_tag_error(const std::string& msg)
            : parse_error(error_kind::invalid_tag, msg) {}
    };

    class truncated_error : public parse_error {
    public:
        explicit truncated_error(const std::string& msg)
            : parse_error(error_kind::truncated, msg) {}
    };

    class crc_mismatch_error : public parse_error {
    public:
        explicit crc_mismatch_error(const std::string& msg)
            : parse_error(error_kind::crc_mismatch, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Payload is not valid UTF-8
     *
     * Only raised by the text view of a chunk; the chunk itself stays valid.
     */
    class encoding_error : public pngchunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngchunk_error(error_kind::not_utf8, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_LIMIT
     * @brief Throw a parse_error of kind limit with formatted message
     */
    #define THROW_LIMIT(...) \
        throw ::pngchunk::parse_error(::pngchunk::error_kind::limit, ::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_INVALID_TAG(...) \
        throw ::pngchunk::invalid_tag_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_TRUNCATED(...) \
        throw ::pngchunk::truncated_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_CRC_MISMATCH(...) \
        throw ::pngchunk::crc_mismatch_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_ENCODING(...) \
        throw ::pngchunk::encoding_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_LIMIT_IF
     * @brief Conditionally throw a parse_error of kind limit
     */
    #define THROW_LIMIT_IF(condition, ...) \
        do { if (condition) THROW_LIMIT(__VA_ARGS__); } while(0)

    #define THROW_INVALID_TAG_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_INVALID_TAG(__VA_ARGS__); } while(0)

    /**
     * @def THROW_TRUNCATED_IF
     * @brief Conditionally throw a truncated_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) THROW_TRUNCATED(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
