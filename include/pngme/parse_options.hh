/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks and containers
     *
     * Controls how strictly chunk records are validated and where
     * non-fatal diagnostics go.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk whose type has a lowercase third letter
         * (reserved bit set) is rejected. When false, the chunk is
         * accepted and a "reserved_bit" warning is reported.
         * Non-letter type bytes and CRC mismatches are always fatal.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted value of a record's length field
         *
         * Records announcing more data than this fail to parse before
         * any payload is read. Default accepts every 32-bit length.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Input offset of the record the warning refers to
         * @param category Warning category (e.g. "reserved_bit")
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
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
