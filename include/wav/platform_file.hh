/**
 * @file platform_file.hh
 * @brief Byte-level file capability consumed by the decoder
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <wav/export_wav.h>

namespace wav {

    /**
     * @class platform_file
     * @brief Abstract seekable byte source
     *
     * Implementations adapt whatever storage the target has: a hosted
     * std::istream, an in-memory image, a FAT file on an SD card block
     * device. The interface carries a single seek cursor, so one instance
     * must not be shared between readers.
     *
     * Error contract:
     * - read() returns the number of bytes copied, which may be less than
     *   requested. At end of file it either returns 0 or throws
     *   end_of_file; callers accept both.
     * - Any other failure is reported by throwing io_error.
     */
    class WAV_EXPORT platform_file {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~platform_file() = default;

            /**
             * @brief Read up to @p size bytes at the current position
             */
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            /**
             * @brief Move the cursor
             *
             * For @c end the target is length() - offset.
             */
            virtual void seek(std::int64_t offset, whence_t whence) = 0;

            /**
             * @brief Total length of the file in bytes
             */
            virtual std::uint64_t length() = 0;

            void seek_from_start(std::uint64_t offset) {
                seek(static_cast<std::int64_t>(offset), set);
            }

            void seek_from_current(std::int64_t offset) {
                seek(offset, cur);
            }

            void seek_from_end(std::uint64_t offset) {
                seek(static_cast<std::int64_t>(offset), end);
            }
    };
}
