//
// Created by igor on 19/10/2026.
//

#include <istream>
#include <string>

#include <wav/stream_file.hh>
#include <wav/exceptions.hh>

namespace wav {

    stream_file::stream_file(std::istream& is) : m_stream(&is) {}

    std::size_t stream_file::read(void* dst, std::size_t size) {
        THROW_IO_IF(!dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        if (m_stream->eof()) {
            return 0;
        }
        THROW_IO_IF(!m_stream->good(), "Stream in bad state");

        m_stream->read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        auto bytes_read = static_cast<std::size_t>(m_stream->gcount());

        THROW_IO_IF(m_stream->bad(), "Stream read failed");
        return bytes_read;
    }

    void stream_file::seek(std::int64_t offset, whence_t whence) {
        m_stream->clear();

        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                // platform_file counts backwards from the end
                dir = std::ios_base::end;
                offset = -offset;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        m_stream->seekg(static_cast<std::streamoff>(offset), dir);
        if (m_stream->fail()) {
            std::string error = "Cannot seek to offset " + std::to_string(offset);
            if (whence == set) {
                error += " (absolute)";
            } else if (whence == cur) {
                error += " (relative)";
            } else {
                error += " (from end)";
            }
            m_stream->clear();
            THROW_IO(error);
        }
    }

    std::uint64_t stream_file::tell() const {
        std::streampos pos = m_stream->tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t stream_file::length() {
        m_stream->clear();
        std::streampos current_pos = m_stream->tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in length()");

        m_stream->seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream->tellg();

        m_stream->seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }
}
