//
// Test the hosted platform file implementations
//

#include <doctest/doctest.h>
#include <array>
#include <sstream>
#include <string>

#include <wav/memory_file.hh>
#include <wav/stream_file.hh>
#include <wav/exceptions.hh>
#include "test_utils.hh"

using namespace wav;

TEST_CASE("memory_file") {
    auto data = bytes({0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    memory_file file(data.data(), data.size());
    std::array<std::byte, 4> buffer{};

    CHECK(file.length() == 10);

    SUBCASE("sequential reads") {
        CHECK(file.read(buffer.data(), 4) == 4);
        CHECK(buffer[3] == std::byte{3});
        CHECK(file.read(buffer.data(), 4) == 4);
        CHECK(buffer[0] == std::byte{4});
        CHECK(file.read(buffer.data(), 4) == 2);
        CHECK(buffer[1] == std::byte{9});
        CHECK(file.read(buffer.data(), 4) == 0);
        CHECK(file.read(buffer.data(), 0) == 0);
    }

    SUBCASE("seek origins") {
        file.seek_from_start(6);
        CHECK(file.tell() == 6);
        file.seek_from_current(-2);
        CHECK(file.tell() == 4);
        file.seek_from_current(3);
        CHECK(file.tell() == 7);
        file.seek_from_end(1);
        CHECK(file.tell() == 9);
        file.seek_from_end(0);
        CHECK(file.tell() == 10);
    }

    SUBCASE("out of range seeks throw and keep the position") {
        file.seek_from_start(5);
        CHECK_THROWS_AS(file.seek_from_start(11), io_error);
        CHECK_THROWS_AS(file.seek_from_current(-6), io_error);
        CHECK_THROWS_AS(file.seek_from_end(11), io_error);
        CHECK(file.tell() == 5);
    }

    SUBCASE("EOF by exception") {
        memory_file strict(data.data(), data.size(), memory_file::eof_policy::throws);
        strict.seek_from_end(2);
        CHECK(strict.read(buffer.data(), 4) == 2);
        CHECK_THROWS_AS(strict.read(buffer.data(), 4), end_of_file);

        try {
            strict.read(buffer.data(), 4);
        } catch (const io_error& e) {
            CHECK(e.code() == error_code::platform_error);
        }
    }

    SUBCASE("null buffer") {
        CHECK_THROWS_AS(file.read(nullptr, 4), io_error);
    }
}

TEST_CASE("stream_file") {
    std::istringstream stream(std::string("0123456789"));
    stream_file file(stream);
    std::array<char, 4> buffer{};

    CHECK(file.length() == 10);
    CHECK(file.tell() == 0);

    SUBCASE("reads until the end of the stream") {
        CHECK(file.read(buffer.data(), 4) == 4);
        CHECK(std::string(buffer.data(), 4) == "0123");
        file.seek_from_start(8);
        CHECK(file.read(buffer.data(), 4) == 2);
        CHECK(std::string(buffer.data(), 2) == "89");
        CHECK(file.read(buffer.data(), 4) == 0);
    }

    SUBCASE("seek after hitting the end clears the stream state") {
        file.seek_from_start(8);
        file.read(buffer.data(), 4);
        file.seek_from_current(-4);
        CHECK(file.tell() == 6);
        CHECK(file.read(buffer.data(), 2) == 2);
        CHECK(std::string(buffer.data(), 2) == "67");
    }

    SUBCASE("seek from end counts backwards") {
        file.seek_from_end(3);
        CHECK(file.tell() == 7);
        CHECK(file.read(buffer.data(), 1) == 1);
        CHECK(buffer[0] == '7');
    }

    SUBCASE("length keeps the position") {
        file.seek_from_start(5);
        CHECK(file.length() == 10);
        CHECK(file.tell() == 5);
    }

    SUBCASE("invalid seek") {
        CHECK_THROWS_AS(file.seek_from_current(-20), io_error);
        // stream is usable again afterwards
        file.seek_from_start(1);
        CHECK(file.read(buffer.data(), 1) == 1);
        CHECK(buffer[0] == '1');
    }
}
