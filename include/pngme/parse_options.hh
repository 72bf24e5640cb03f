/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk data
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks and PNG files
     *
     * Controls strictness, size limits and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk whose declared length exceeds max_chunk_size
         * aborts parsing. When false, a warning is reported and the chunk
         * is decoded anyway.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset of the chunk record the warning refers to
         * @param category Warning category ("length_mismatch", "size_limit")
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

} // namespace pngme
