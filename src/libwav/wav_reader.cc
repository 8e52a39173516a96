//
// Created by igor on 19/10/2026.
//

#include <algorithm>
#include <array>

#include <wav/wav_reader.hh>
#include <wav/chunk_scanner.hh>
#include <wav/exceptions.hh>
#include <wav/wav_config.h>

#include "platform_call.hh"

namespace wav {

    static_assert(LIBWAV_SCRATCH_SIZE >= chunk_scanner::min_scratch_size,
                  "LIBWAV_SCRATCH_SIZE must hold at least a basic 'fmt ' payload");
    static_assert(LIBWAV_MAX_CHUNKS >= 2, "LIBWAV_MAX_CHUNKS must hold 'fmt ' and 'data'");

    stream_layout locate_stream(platform_file& file, const parse_options& options) {
        std::array<std::byte, LIBWAV_SCRATCH_SIZE> scratch;
        chunk_table<LIBWAV_MAX_CHUNKS> chunks;
        return locate_stream(file, scratch.data(), scratch.size(), chunks, options);
    }

    stream_layout locate_stream(platform_file& file,
                                std::byte* scratch, std::size_t scratch_size,
                                chunk_list& chunks,
                                const parse_options& options) {
        chunk_scanner scanner(file, scratch, scratch_size, options);
        platform_call("Chunk scan", [&] { scanner.scan(chunks); });

        const chunk* fmt = chunks.find(chunk_kind::fmt);
        THROW_PARSE_IF(!fmt, error_code::no_fmt_chunk_found,
                       "No 'fmt ' chunk among the ", chunks.size(), " scanned chunks");

        const chunk* data = chunks.find(chunk_kind::data);
        THROW_PARSE_IF(!data, error_code::no_data_chunk_found,
                       "No 'data' chunk among the ", chunks.size(), " scanned chunks");

        std::size_t available = platform_call("Reading 'fmt ' chunk", [&] { return scanner.load(*fmt); });

        stream_layout layout;
        layout.fmt = decode_fmt(scanner.scratch(), available, fmt->size(), scanner.byte_order());
        layout.data_start = data->start;
        layout.data_end = data->end;
        layout.order = scanner.byte_order();

        platform_call("Seek to audio data", [&] { file.seek_from_start(layout.data_start); });
        return layout;
    }

    wav_reader::wav_reader(platform_file& file, const parse_options& options)
        : m_file(file)
        , m_layout(locate_stream(file, options)) {
    }

    wav_reader::wav_reader(platform_file& file, const stream_layout& layout)
        : m_file(file)
        , m_layout(layout) {
        THROW_PARSE_IF(m_layout.data_end < m_layout.data_start, error_code::chunk_size_incorrect,
                       "Data chunk ends at ", m_layout.data_end, " before its start ", m_layout.data_start);
        platform_call("Seek to audio data", [&] { m_file.seek_from_start(m_layout.data_start); });
    }

    std::size_t wav_reader::read(void* dst, std::size_t size) {
        THROW_IO_IF(!dst, "Null buffer in wav_reader::read");

        std::uint64_t available = m_layout.data_size() - m_position;
        auto to_read = static_cast<std::size_t>(std::min(static_cast<std::uint64_t>(size), available));

        if (to_read == 0) {
            return 0;
        }

        std::size_t bytes_read = platform_call("Read", [&]() -> std::size_t {
            try {
                return m_file.read(dst, to_read);
            } catch (const end_of_file&) {
                return 0;
            }
        });

        m_position += bytes_read;
        return bytes_read;
    }

    void wav_reader::try_seek(std::int64_t sample_offset) {
        auto limit = static_cast<std::int64_t>(m_layout.data_size());

        // Reject early so the byte conversion below cannot overflow
        if (sample_offset > limit || sample_offset < -limit) {
            throw wav_error(error_code::seek_out_of_bounds,
                            build_error_msg("Seek by ", sample_offset, " samples leaves the data chunk of ",
                                            limit, " bytes"));
        }

        std::int64_t byte_offset = sample_offset * static_cast<std::int64_t>(sample_size(m_layout.fmt.format));
        std::int64_t target = static_cast<std::int64_t>(m_position) + byte_offset;
        if (target < 0 || target > limit) {
            throw wav_error(error_code::seek_out_of_bounds,
                            build_error_msg("Seek by ", sample_offset, " samples to byte ", target,
                                            " leaves the data chunk of ", limit, " bytes"));
        }

        platform_call("Seek", [&] { m_file.seek_from_current(byte_offset); });
        m_position = static_cast<std::uint64_t>(target);
    }

    void wav_reader::restart() {
        platform_call("Seek", [&] { m_file.seek_from_current(-static_cast<std::int64_t>(m_position)); });
        m_position = 0;
    }

} // namespace wav
