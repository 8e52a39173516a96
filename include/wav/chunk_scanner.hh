/**
 * @file chunk_scanner.hh
 * @brief Windowed walk over the top-level chunks of a RIFF/WAVE file
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <wav/byte_order.hh>
#include <wav/chunk.hh>
#include <wav/chunk_table.hh>
#include <wav/parse_options.hh>
#include <wav/platform_file.hh>
#include <wav/export_wav.h>

namespace wav {

    /**
     * @class chunk_scanner
     * @brief Builds a chunk table using only a caller-provided scratch buffer
     *
     * The scanner keeps a window of the file in the scratch buffer and a
     * cursor at the next chunk header. A header that is not fully inside
     * the window triggers a seek to the header offset and a refill, so
     * payloads are skipped without being read and the buffer may be much
     * smaller than the header region of the file.
     *
     * @code
     * std::array<std::byte, 64> scratch;
     * wav::chunk_table<16> chunks;
     * wav::chunk_scanner scanner(file, scratch.data(), scratch.size(), options);
     * scanner.scan(chunks);
     * @endcode
     *
     * The scanner only borrows the file, the scratch buffer and the
     * options; all three must outlive it.
     */
    class WAV_EXPORT chunk_scanner {
    public:
        static constexpr std::size_t header_size = 8;       ///< tag + size
        static constexpr std::size_t container_size = 12;   ///< RIFF header + form type
        static constexpr std::size_t min_scratch_size = 16; ///< basic 'fmt ' payload
        static constexpr std::uint32_t streaming_size = 0xFFFFFFFF; ///< size not yet known

        /**
         * @throws parse_error buffer_size_incorrect if @p scratch_size is
         *         below min_scratch_size
         */
        chunk_scanner(platform_file& file, std::byte* scratch, std::size_t scratch_size,
                      const parse_options& options);

        chunk_scanner(const chunk_scanner&) = delete;
        chunk_scanner& operator=(const chunk_scanner&) = delete;

        /**
         * @brief Validate the container header and collect the subchunks
         *
         * Stops at end of file (or end of the RIFF container) or when
         * @p chunks is full. Previous content of @p chunks is discarded.
         *
         * @throws parse_error no_riff_chunk_found, no_wave_tag_found,
         *         chunk_size_incorrect (strict mode), exceeded_max_chunks
         *         (only with parse_options::fail_on_capacity)
         * @throws io_error on platform failures
         */
        void scan(chunk_list& chunks);

        /**
         * @brief Load the head of a chunk payload into the scratch buffer
         * @return Number of payload bytes available at scratch(),
         *         at most the scratch size
         */
        std::size_t load(const chunk& c);

        [[nodiscard]] const std::byte* scratch() const noexcept { return m_scratch; }

        /// Byte order of the container (valid after scan)
        [[nodiscard]] wav::byte_order byte_order() const noexcept { return m_order; }

        /// riff or rifx (valid after scan)
        [[nodiscard]] chunk_kind container() const noexcept { return m_container; }

        /// Size field of the container header (valid after scan)
        [[nodiscard]] std::uint32_t riff_size() const noexcept { return m_riff_size; }

    private:
        void read_container_header();
        bool read_next_chunk(chunk_list& chunks);

        void fill_window(std::uint64_t offset);
        [[nodiscard]] std::size_t resident(std::uint64_t offset) const noexcept;
        [[nodiscard]] const std::byte* window_at(std::uint64_t offset) const noexcept;

        platform_file& m_file;
        std::byte* m_scratch;
        std::size_t m_scratch_size;
        const parse_options& m_options;

        std::uint64_t m_length = 0;         // file length
        std::uint64_t m_scan_end = 0;       // end of the RIFF payload
        std::uint64_t m_cursor = 0;         // next chunk header
        std::uint64_t m_window_offset = 0;  // file offset of m_scratch[0]
        std::size_t m_window_length = 0;    // valid bytes in m_scratch

        wav::byte_order m_order = wav::byte_order::little;
        chunk_kind m_container = chunk_kind::riff;
        std::uint32_t m_riff_size = 0;
    };

} // namespace wav
