/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk records
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunk records
     *
     * Controls size limits, how a chunk_iterator reacts to damaged
     * records, and warning reporting.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, chunk_iterator fails on the first damaged record.
         * When false, records with an invalid type or a CRC mismatch are
         * reported through on_warning and skipped. Truncated records
         * always fail since the next record cannot be located.
         * chunk::parse ignores this flag.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted payload length in bytes
         *
         * Records declaring a longer payload are rejected before any
         * payload byte is touched. Default is the largest 32-bit length.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the record the warning is about
         * @param category Warning category (e.g., "trailing_data", "crc_mismatch")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
