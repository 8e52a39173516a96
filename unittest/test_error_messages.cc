//
// Test that errors carry the right code and a useful message
//

#include <doctest/doctest.h>
#include <array>
#include <string>
#include <vector>

#include <wav/chunk_scanner.hh>
#include <wav/chunk_table.hh>
#include <wav/exceptions.hh>
#include <wav/memory_file.hh>
#include <wav/parse_options.hh>
#include "test_utils.hh"

using namespace wav;

namespace {
    // Scans the image and returns the error raised, or fails the test
    parse_error scan_error(const std::vector<std::byte>& data, const parse_options& opts = {}) {
        memory_file file(data.data(), data.size());
        std::array<std::byte, 64> scratch{};
        chunk_table<8> chunks;
        chunk_scanner scanner(file, scratch.data(), scratch.size(), opts);
        try {
            scanner.scan(chunks);
        } catch (const parse_error& e) {
            return e;
        }
        FAIL("scan did not throw");
        return parse_error(error_code::platform_error, "");
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST_CASE("Error codes have stable names") {
    CHECK(std::string(to_string(error_code::no_riff_chunk_found)) == "no_riff_chunk_found");
    CHECK(std::string(to_string(error_code::no_wave_tag_found)) == "no_wave_tag_found");
    CHECK(std::string(to_string(error_code::no_fmt_chunk_found)) == "no_fmt_chunk_found");
    CHECK(std::string(to_string(error_code::no_data_chunk_found)) == "no_data_chunk_found");
    CHECK(std::string(to_string(error_code::unsupported_audio_format)) == "unsupported_audio_format");
    CHECK(std::string(to_string(error_code::unsupported_channel_count)) == "unsupported_channel_count");
    CHECK(std::string(to_string(error_code::unknown_encoding)) == "unknown_encoding");
    CHECK(std::string(to_string(error_code::fmt_chunk_error)) == "fmt_chunk_error");
    CHECK(std::string(to_string(error_code::chunk_size_incorrect)) == "chunk_size_incorrect");
    CHECK(std::string(to_string(error_code::buffer_size_incorrect)) == "buffer_size_incorrect");
    CHECK(std::string(to_string(error_code::exceeded_max_chunks)) == "exceeded_max_chunks");
    CHECK(std::string(to_string(error_code::seek_out_of_bounds)) == "seek_out_of_bounds");
    CHECK(std::string(to_string(error_code::platform_error)) == "platform_error");
}

TEST_CASE("Exception hierarchy") {
    try {
        THROW_EOF("EOF at ", 42);
    } catch (const wav_error& e) {
        CHECK(e.code() == error_code::platform_error);
        CHECK(std::string(e.what()) == "EOF at 42");
    }

    CHECK_THROWS_AS(THROW_EOF("x"), io_error);
    CHECK_THROWS_AS(THROW_IO("x"), std::runtime_error);
    CHECK_THROWS_AS(THROW_PARSE(error_code::fmt_chunk_error, "x"), wav_error);
}

TEST_CASE("Improved error messages") {
    SUBCASE("wrong container id is quoted and escaped") {
        auto data = wave_builder("RIFQ").fmt(1, 1, 8000, 16).data(bytes({0, 0})).build();
        auto e = scan_error(data);
        CHECK(e.code() == error_code::no_riff_chunk_found);
        CHECK(contains(e.what(), "'RIFQ'"));
        CHECK(contains(e.what(), "offset 0"));

        data[3] = std::byte{0x01};
        e = scan_error(data);
        CHECK(contains(e.what(), "'RIF\\x01'"));
    }

    SUBCASE("wrong form type") {
        auto data = wave_builder().form("AVI ").data(bytes({0, 0})).build();
        auto e = scan_error(data);
        CHECK(e.code() == error_code::no_wave_tag_found);
        CHECK(contains(e.what(), "'AVI '"));
    }

    SUBCASE("chunk size limit exceeded - shows chunk details") {
        auto data = wave_builder().chunk("LIST", bytes({0, 0, 0, 0}), 10000000).build();
        parse_options opts;
        opts.max_chunk_size = 1024;
        auto e = scan_error(data, opts);
        CHECK(e.code() == error_code::chunk_size_incorrect);
        CHECK(contains(e.what(), "'LIST'"));
        CHECK(contains(e.what(), "offset 12"));
        CHECK(contains(e.what(), "10000000"));
        CHECK(contains(e.what(), "1024"));
    }

    SUBCASE("chunk past end of file") {
        auto data = wave_builder().fmt(1, 1, 8000, 16).chunk("data", bytes({1, 2, 3, 4}), 100).build();
        auto e = scan_error(data);
        CHECK(e.code() == error_code::chunk_size_incorrect);
        CHECK(contains(e.what(), "'data'"));
        CHECK(contains(e.what(), "offset 36"));
        CHECK(contains(e.what(), "declares 100"));
        CHECK(contains(e.what(), "only 4 bytes remain"));
    }

    SUBCASE("truncated chunk header") {
        // four bytes of a header left inside the container
        auto data = wave_builder().fmt(1, 1, 8000, 16).riff_size(4 + 24 + 4)
                                  .trailer(bytes({'d', 'a', 't', 'a'})).build();
        auto e = scan_error(data);
        CHECK(e.code() == error_code::chunk_size_incorrect);
        CHECK(contains(e.what(), "offset 36"));
        CHECK(contains(e.what(), "only 4 bytes"));
    }

    SUBCASE("scratch buffer too small") {
        auto data = reference_wave();
        memory_file file(data.data(), data.size());
        std::array<std::byte, 8> scratch{};
        parse_options opts;
        try {
            chunk_scanner scanner(file, scratch.data(), scratch.size(), opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::buffer_size_incorrect);
            CHECK(contains(e.what(), "8 bytes"));
            CHECK(contains(e.what(), "minimum 16"));
        }
    }
}
