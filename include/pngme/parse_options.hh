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
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls size limits, strictness and warning handling. None of the
     * options turns a malformed stream into a partially parsed one.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk longer than max_chunk_size is an error.
         * When false, a "size_limit" warning is emitted and the chunk is
         * parsed in full.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits.
         */
        std::uint64_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category ("size_limit", "ordering", "missing_header")
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
