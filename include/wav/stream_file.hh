//
// Created by igor on 19/10/2026.
//

#pragma once

#include <iosfwd>

#include <wav/platform_file.hh>

namespace wav {

    // Hosted platform file backed by a std::istream (usually std::ifstream).
    // The stream must outlive the stream_file.
    class WAV_EXPORT stream_file : public platform_file {
        public:
            explicit stream_file(std::istream& is);
            ~stream_file() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::int64_t offset, whence_t whence) override;
            std::uint64_t length() override;

            std::uint64_t tell() const;

        private:
            std::istream* m_stream;
    };
}
