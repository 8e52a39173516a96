//
// Created by igor on 19/10/2026.
//

#include <algorithm>
#include <cstring>

#include <wav/memory_file.hh>
#include <wav/exceptions.hh>

namespace wav {

    memory_file::memory_file(const void* data, std::size_t size, eof_policy policy)
        : m_data(static_cast<const unsigned char*>(data)),
          m_size(size),
          m_position(0),
          m_policy(policy) {
        THROW_IO_IF(!m_data && m_size > 0, "Null data for non-empty memory_file");
    }

    std::size_t memory_file::read(void* dst, std::size_t size) {
        THROW_IO_IF(!dst, "Null buffer in memory_file::read");

        if (size == 0) {
            return 0;
        }

        if (m_position >= m_size) {
            if (m_policy == eof_policy::throws) {
                THROW_EOF("End of file at offset ", m_position);
            }
            return 0;
        }

        std::size_t to_read = std::min(size, m_size - m_position);
        std::memcpy(dst, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    void memory_file::seek(std::int64_t offset, whence_t whence) {
        std::int64_t base;
        switch (whence) {
            case set:
                base = 0;
                break;
            case cur:
                base = static_cast<std::int64_t>(m_position);
                break;
            case end:
                base = static_cast<std::int64_t>(m_size);
                offset = -offset;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        std::int64_t target = base + offset;
        THROW_IO_IF(target < 0 || target > static_cast<std::int64_t>(m_size),
                    "Seek out of bounds: ", target, " not in [0, ", m_size, "]");
        m_position = static_cast<std::size_t>(target);
    }
}
