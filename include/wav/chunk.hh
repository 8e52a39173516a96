/**
 * @file chunk.hh
 * @brief Chunk descriptor for RIFF/WAVE files
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <wav/fourcc.hh>
#include <wav/export_wav.h>

namespace wav {

    /**
     * @enum chunk_kind
     * @brief Chunk tags the decoder recognizes
     */
    enum class chunk_kind {
        riff,    ///< "RIFF", little-endian container
        rifx,    ///< "RIFX", big-endian container
        wave,    ///< "WAVE" form type
        fmt,     ///< "fmt " format descriptor
        data,    ///< "data" audio payload
        unknown  ///< anything else, raw tag kept in chunk::id
    };

    /**
     * @brief Map a raw tag to its kind
     */
    WAV_EXPORT chunk_kind classify(const fourcc& id) noexcept;

    WAV_EXPORT const char* to_string(chunk_kind kind) noexcept;

    /**
     * @struct chunk
     * @brief Location of one chunk payload in the file
     *
     * Offsets are absolute. @c start points just past the 8-byte tag+size
     * header, @c end = start + declared size. The pad byte following an
     * odd-sized payload is not part of [start, end).
     */
    struct chunk {
        chunk_kind kind = chunk_kind::unknown;
        fourcc id;                   ///< Tag as read from the file
        std::uint64_t start = 0;     ///< First payload byte
        std::uint64_t end = 0;       ///< One past the last payload byte

        [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }

        /// Offset of the header of the chunk that follows (word aligned)
        [[nodiscard]] std::uint64_t next_offset() const noexcept {
            return end + (size() & 1);
        }
    };

} // namespace wav
