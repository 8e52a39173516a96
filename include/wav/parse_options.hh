/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for WAV files
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace wav {

    /**
     * @struct parse_options
     * @brief Run-time configuration of the chunk scanner and the reader
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, truncated or oversized chunks are errors
         * (error_code::chunk_size_incorrect). When false they are clamped
         * to what the file holds and reported as warnings.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is 4GB, the largest size a 32-bit field can declare.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;

        /**
         * @brief Accept big-endian RIFX containers
         */
        bool allow_rifx = true;

        /**
         * @brief Fail when the chunk table fills up before end of file
         *
         * By default a full table ends the scan with a "capacity"
         * warning, since audio data normally precedes trailing metadata.
         */
        bool fail_on_capacity = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category ("unknown_chunk", "capacity",
         *        "riff_size", "truncated", "size_limit")
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

} // namespace wav
