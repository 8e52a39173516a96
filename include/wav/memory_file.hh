//
// Created by igor on 19/10/2026.
//

#pragma once

#include <wav/platform_file.hh>

namespace wav {

    // Platform file over a caller-owned byte range, e.g. a WAV image linked
    // into flash. Nothing is copied; the range must outlive the memory_file.
    class WAV_EXPORT memory_file : public platform_file {
        public:
            // How end of file is reported by read()
            enum class eof_policy {
                zero_read, // return 0 like a hosted file
                throws     // throw end_of_file like embedded FAT drivers
            };

            memory_file(const void* data, std::size_t size,
                        eof_policy policy = eof_policy::zero_read);

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::int64_t offset, whence_t whence) override;
            std::uint64_t length() override { return m_size; }

            [[nodiscard]] std::uint64_t tell() const { return m_position; }

        private:
            const unsigned char* m_data;
            std::size_t m_size;
            std::size_t m_position;
            eof_policy m_policy;
    };
}
