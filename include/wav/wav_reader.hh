/**
 * @file wav_reader.hh
 * @brief Streaming access to the audio payload of a WAV file
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

#include <wav/byte_order.hh>
#include <wav/chunk_table.hh>
#include <wav/format.hh>
#include <wav/parse_options.hh>
#include <wav/platform_file.hh>
#include <wav/export_wav.h>

namespace wav {

    /**
     * @struct stream_layout
     * @brief What the reader keeps from a scanned file
     */
    struct stream_layout {
        fmt_descriptor fmt;
        std::uint64_t data_start = 0;  ///< first byte of the 'data' payload
        std::uint64_t data_end = 0;    ///< one past the last payload byte
        wav::byte_order order = wav::byte_order::little;

        [[nodiscard]] std::uint64_t data_size() const noexcept { return data_end - data_start; }
    };

    /**
     * @brief Scan a file and locate its format and audio data
     *
     * Uses a stack scratch buffer of LIBWAV_SCRATCH_SIZE bytes and a chunk
     * table of LIBWAV_MAX_CHUNKS entries. On success the file is positioned
     * at the first audio byte.
     *
     * @throws parse_error no_fmt_chunk_found, no_data_chunk_found, and
     *         everything chunk_scanner::scan() and decode_fmt() throw
     * @throws io_error on platform failures
     */
    WAV_EXPORT stream_layout locate_stream(platform_file& file, const parse_options& options = {});

    /**
     * @brief locate_stream() with caller-provided scratch buffer and chunk list
     *
     * @p chunks holds the scanned chunk table afterwards.
     */
    WAV_EXPORT stream_layout locate_stream(platform_file& file,
                                           std::byte* scratch, std::size_t scratch_size,
                                           chunk_list& chunks,
                                           const parse_options& options = {});

    /**
     * @class wav_reader
     * @brief Cursor over the 'data' chunk of a WAV file
     *
     * Reads never cross the end of the data chunk. Seeks are expressed in
     * samples of the stream's sample format and are rejected when they
     * would leave the data chunk. The reader assumes it is the only user
     * of the file's seek cursor.
     */
    class WAV_EXPORT wav_reader {
    public:
        /**
         * @brief Scan @p file and position it at the audio data
         *
         * The file is borrowed and must outlive the reader.
         */
        explicit wav_reader(platform_file& file, const parse_options& options = {});

        /**
         * @brief Attach to a file already scanned with locate_stream()
         */
        wav_reader(platform_file& file, const stream_layout& layout);

        wav_reader(const wav_reader&) = delete;
        wav_reader& operator=(const wav_reader&) = delete;

        /**
         * @brief Read raw sample bytes
         * @return Bytes copied into @p dst; 0 once the data chunk is exhausted
         * @throws io_error on platform failures
         */
        std::size_t read(void* dst, std::size_t size);

        /**
         * @brief Move by @p sample_offset samples relative to the current position
         * @throws wav_error seek_out_of_bounds if the target lies outside
         *         the data chunk; the position is then unchanged
         * @throws io_error on platform failures
         */
        void try_seek(std::int64_t sample_offset);

        /**
         * @brief Go back to the first audio byte
         */
        void restart();

        /// Bytes between the start of the data chunk and the current position
        [[nodiscard]] std::uint64_t played() const noexcept { return m_position; }

        [[nodiscard]] bool is_eof() const noexcept { return m_position == m_layout.data_size(); }

        [[nodiscard]] std::uint32_t sample_rate() const noexcept { return m_layout.fmt.sample_rate; }
        [[nodiscard]] wav::channels channels() const noexcept { return m_layout.fmt.channels; }
        [[nodiscard]] wav::sample_format sample_format() const noexcept { return m_layout.fmt.format; }
        [[nodiscard]] wav::byte_order byte_order() const noexcept { return m_layout.order; }

        [[nodiscard]] const fmt_descriptor& fmt() const noexcept { return m_layout.fmt; }
        [[nodiscard]] const stream_layout& layout() const noexcept { return m_layout; }
        [[nodiscard]] std::uint64_t data_size() const noexcept { return m_layout.data_size(); }

    private:
        platform_file& m_file;
        stream_layout m_layout;
        std::uint64_t m_position = 0;
    };

    namespace detail {
        template<typename File>
        struct file_holder {
            File m_held;
        };
    }

    /**
     * @class basic_wav_file
     * @brief wav_reader that owns its platform file
     *
     * The file is stored by value, so no allocation happens. The reader
     * refers to the stored file, hence the type is neither copyable nor
     * movable.
     *
     * @code
     * wav::basic_wav_file<wav::memory_file> wav(wav::memory_file(image, image_size));
     * std::size_t n = wav.read(buffer, sizeof(buffer));
     * @endcode
     */
    template<typename File>
    class basic_wav_file : private detail::file_holder<File>, public wav_reader {
        static_assert(std::is_base_of_v<platform_file, File>,
                      "basic_wav_file requires a platform_file implementation");
    public:
        explicit basic_wav_file(File file, const parse_options& options = {})
            : detail::file_holder<File>{std::move(file)}
            , wav_reader(this->m_held, options) {}

        basic_wav_file(const basic_wav_file&) = delete;
        basic_wav_file& operator=(const basic_wav_file&) = delete;

        File& file() noexcept { return this->m_held; }
        const File& file() const noexcept { return this->m_held; }
    };

} // namespace wav
