//
// Created by igor on 19/10/2026.
//

#include <algorithm>

#include <wav/chunk_scanner.hh>
#include <wav/exceptions.hh>

namespace wav {

    namespace {
        template<typename... Args>
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, Args&&... args) {
            if (options.on_warning) {
                options.on_warning(offset, category, build_error_msg(std::forward<Args>(args)...));
            }
        }
    }

    chunk_scanner::chunk_scanner(platform_file& file, std::byte* scratch, std::size_t scratch_size,
                                 const parse_options& options)
        : m_file(file)
        , m_scratch(scratch)
        , m_scratch_size(scratch_size)
        , m_options(options) {
        THROW_PARSE_IF(!m_scratch, error_code::buffer_size_incorrect, "Null scratch buffer");
        THROW_PARSE_IF(m_scratch_size < min_scratch_size, error_code::buffer_size_incorrect,
                       "Scratch buffer of ", m_scratch_size, " bytes is too small (minimum ",
                       min_scratch_size, " bytes required)");
    }

    void chunk_scanner::scan(chunk_list& chunks) {
        chunks.clear();
        m_length = m_file.length();
        m_window_length = 0;

        read_container_header();

        m_cursor = container_size;
        while (m_cursor < m_scan_end) {
            if (chunks.full()) {
                THROW_PARSE_IF(m_options.fail_on_capacity, error_code::exceeded_max_chunks,
                               "Chunk table capacity of ", chunks.capacity(),
                               " reached at offset ", m_cursor, " with ", m_scan_end - m_cursor,
                               " bytes left to scan");
                warn(m_options, m_cursor, "capacity",
                     "Chunk table full (", chunks.capacity(), " chunks), ignoring the remaining ",
                     m_scan_end - m_cursor, " bytes");
                break;
            }
            if (!read_next_chunk(chunks)) {
                break;
            }
        }
    }

    std::size_t chunk_scanner::load(const chunk& c) {
        fill_window(c.start);
        return static_cast<std::size_t>(std::min<std::uint64_t>(c.size(), m_window_length));
    }

    void chunk_scanner::read_container_header() {
        fill_window(0);

        THROW_PARSE_IF(m_window_length < header_size, error_code::no_riff_chunk_found,
                       "File too short for a RIFF header: ", m_window_length, " bytes");

        fourcc root_id = fourcc::from_bytes(m_scratch);
        m_container = classify(root_id);
        if (m_container == chunk_kind::riff) {
            m_order = wav::byte_order::little;
        } else if (m_container == chunk_kind::rifx) {
            THROW_PARSE_IF(!m_options.allow_rifx, error_code::no_riff_chunk_found,
                           "RIFX (big-endian) container found but RIFX support is disabled");
            m_order = wav::byte_order::big;
        } else {
            THROW_PARSE(error_code::no_riff_chunk_found,
                        "Expected 'RIFF' or 'RIFX' at offset 0, found ", root_id);
        }

        m_riff_size = load_u32(m_scratch + 4, m_order);

        THROW_PARSE_IF(m_window_length < container_size, error_code::no_wave_tag_found,
                       "File ends before the form type (", m_window_length, " bytes)");
        fourcc form = fourcc::from_bytes(m_scratch + header_size);
        THROW_PARSE_IF(classify(form) != chunk_kind::wave, error_code::no_wave_tag_found,
                       "Expected form type 'WAVE' at offset 8, found ", form);

        // Streaming writers leave the size at 0 or 0xFFFFFFFF; fall back to the
        // file length when the declared size cannot be right.
        std::uint64_t riff_end = header_size + std::uint64_t(m_riff_size);
        if (m_riff_size < 4 || riff_end > m_length) {
            warn(m_options, 4, "riff_size",
                 "RIFF size ", m_riff_size, " does not match file length ", m_length,
                 ", scanning to end of file");
            m_scan_end = m_length;
        } else {
            if (riff_end + (m_riff_size & 1) < m_length) {
                warn(m_options, riff_end, "riff_size",
                     m_length - riff_end, " bytes after the end of the RIFF container are ignored");
            }
            m_scan_end = riff_end;
        }
    }

    bool chunk_scanner::read_next_chunk(chunk_list& chunks) {
        std::uint64_t header_offset = m_cursor;

        if (resident(header_offset) < header_size) {
            fill_window(header_offset);
        }

        std::size_t available = resident(header_offset);
        if (available == 0) {
            // platform reported EOF before the advertised length
            return false;
        }
        if (available < header_size || m_scan_end - header_offset < header_size) {
            THROW_PARSE_IF(m_options.strict, error_code::chunk_size_incorrect,
                           "Truncated chunk header at offset ", header_offset, ": only ",
                           std::min<std::uint64_t>(available, m_scan_end - header_offset),
                           " bytes left");
            warn(m_options, header_offset, "truncated",
                 "Truncated chunk header at offset ", header_offset, ", stopping scan");
            return false;
        }

        const std::byte* header = window_at(header_offset);

        chunk c;
        c.id = fourcc::from_bytes(header);
        c.kind = classify(c.id);
        c.start = header_offset + header_size;

        std::uint64_t declared = load_u32(header + 4, m_order);

        // Streaming writers leave the data size at 0xFFFFFFFF, same as the RIFF size
        if (c.kind == chunk_kind::data && declared == streaming_size && c.start + declared > m_length) {
            warn(m_options, header_offset, "riff_size",
                 "Data chunk size left at 0x", std::hex, declared, std::dec,
                 ", assuming the audio runs to offset ", m_scan_end);
            declared = m_scan_end > c.start ? m_scan_end - c.start : 0;
        }

        std::uint64_t size = declared;

        if (size > m_options.max_chunk_size) {
            THROW_PARSE_IF(m_options.strict, error_code::chunk_size_incorrect,
                           "Chunk ", c.id, " at offset ", header_offset, " has size ", size,
                           " bytes, which exceeds maximum allowed size of ",
                           m_options.max_chunk_size, " bytes");
            warn(m_options, header_offset, "size_limit",
                 "Chunk ", c.id, " size ", size, " exceeds maximum ", m_options.max_chunk_size,
                 ", clamping to limit");
            size = m_options.max_chunk_size;
        }

        if (c.start + size > m_length) {
            THROW_PARSE_IF(m_options.strict, error_code::chunk_size_incorrect,
                           "Chunk ", c.id, " at offset ", header_offset, " declares ", size,
                           " bytes but only ", m_length - c.start, " bytes remain in the file");
            warn(m_options, header_offset, "truncated",
                 "Chunk ", c.id, " at offset ", header_offset, " is truncated from ", size,
                 " to ", m_length - c.start, " bytes");
            size = m_length - c.start;
        }

        c.end = c.start + size;

        if (c.kind == chunk_kind::unknown) {
            warn(m_options, header_offset, "unknown_chunk",
                 "Skipping unknown chunk ", c.id, " of ", size, " bytes");
        }

        chunks.push_back(c);
        // clamping only shortens the recorded payload, the next header follows the declared one
        m_cursor = c.start + declared + (declared & 1);
        return true;
    }

    void chunk_scanner::fill_window(std::uint64_t offset) {
        m_window_offset = offset;
        m_window_length = 0;

        if (offset >= m_length) {
            return;
        }

        m_file.seek_from_start(offset);

        // Block device drivers may return less than asked for, keep reading
        // until the window is full or the file ends.
        while (m_window_length < m_scratch_size) {
            std::size_t got = 0;
            try {
                got = m_file.read(m_scratch + m_window_length, m_scratch_size - m_window_length);
            } catch (const end_of_file&) {
                got = 0;
            }
            if (got == 0) {
                break;
            }
            m_window_length += got;
        }
    }

    std::size_t chunk_scanner::resident(std::uint64_t offset) const noexcept {
        if (offset < m_window_offset || offset >= m_window_offset + m_window_length) {
            return 0;
        }
        return static_cast<std::size_t>(m_window_offset + m_window_length - offset);
    }

    const std::byte* chunk_scanner::window_at(std::uint64_t offset) const noexcept {
        return m_scratch + (offset - m_window_offset);
    }

} // namespace wav
