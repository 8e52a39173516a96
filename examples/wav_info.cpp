/**
 * @file wav_info.cpp
 * @brief Print the layout and the first samples of a WAV file
 *
 * Usage: wav_info [--lenient] <file.wav>
 */

#include <wav/wav_reader.hh>
#include <wav/chunk_scanner.hh>
#include <wav/chunk_table.hh>
#include <wav/stream_file.hh>
#include <wav/exceptions.hh>

#include <array>
#include <cstdint>
#include <cstring>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
    void print_nested(const std::exception& e, int level = 0) {
        std::cerr << std::string(static_cast<std::size_t>(level) * 2, ' ') << e.what() << "\n";
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            print_nested(inner, level + 1);
        }
    }
}

int main(int argc, char* argv[]) {
    wav::parse_options options;
    const char* path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--lenient") == 0) {
            options.strict = false;
        } else {
            path = argv[i];
        }
    }

    if (!path) {
        std::cerr << "Usage: " << argv[0] << " [--lenient] <file.wav>\n";
        return 1;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        std::cerr << "Failed to open file: " << path << "\n";
        return 1;
    }

    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    wav::stream_file file(stream);
    std::array<std::byte, 256> scratch{};
    wav::chunk_table<32> chunks;

    try {
        auto layout = wav::locate_stream(file, scratch.data(), scratch.size(), chunks, options);

        std::cout << "Parsing WAV file: " << path << "\n";
        std::cout << "=====================================\n\n";

        std::cout << "Chunks:\n";
        for (const auto& c : chunks) {
            std::cout << "  " << c.id << " at " << c.start - wav::chunk_scanner::header_size
                      << ", " << c.size() << " bytes\n";
        }
        std::cout << "\n";

        const auto& fmt = layout.fmt;
        std::cout << "Format:\n";
        std::cout << "  Channels: " << wav::to_string(fmt.channels) << "\n";
        std::cout << "  Sample Rate: " << fmt.sample_rate << " Hz\n";
        std::cout << "  Avg Bytes/Sec: " << fmt.byte_rate << "\n";
        std::cout << "  Block Align: " << fmt.block_align << "\n";
        std::cout << "  Sample Format: " << wav::to_string(fmt.format) << "\n";
        std::cout << "  Byte Order: " << (layout.order == wav::byte_order::big ? "big" : "little") << "\n";
        if (fmt.extension_size > 0) {
            std::cout << "  Extended Format Size: " << fmt.extension_size << " bytes\n";
        }
        std::cout << "\n";

        wav::wav_reader reader(file, layout);

        std::uint64_t frame_size = wav::sample_size(fmt.format) * wav::channel_count(fmt.channels);
        std::uint64_t frames = reader.data_size() / frame_size;
        std::cout << "Data:\n";
        std::cout << "  Size: " << reader.data_size() << " bytes\n";
        std::cout << "  Total Frames: " << frames << "\n";
        std::cout << "  Duration: " << std::fixed << std::setprecision(2)
                  << static_cast<double>(frames) / fmt.sample_rate << " seconds\n";

        std::array<std::uint8_t, 16> preview{};
        std::size_t got = reader.read(preview.data(), preview.size());
        std::cout << "  First " << got << " bytes (hex): ";
        for (std::size_t i = 0; i < got; ++i) {
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << static_cast<int>(preview[i]) << " ";
        }
        std::cout << std::dec << "\n";
    } catch (const wav::wav_error& e) {
        std::cerr << "Error parsing file (" << wav::to_string(e.code()) << "):\n";
        print_nested(e, 1);
        return 1;
    }

    return 0;
}
