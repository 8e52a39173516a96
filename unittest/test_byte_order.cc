//
// Test byte order helpers
//

#include <doctest/doctest.h>

#include <wav/byte_order.hh>
#include "test_utils.hh"

using namespace wav;

TEST_CASE("byte order - loads") {
    auto data = bytes({0x12, 0x34, 0x56, 0x78});

    CHECK(load_u16(data.data(), byte_order::little) == 0x3412);
    CHECK(load_u16(data.data(), byte_order::big) == 0x1234);
    CHECK(load_u32(data.data(), byte_order::little) == 0x78563412u);
    CHECK(load_u32(data.data(), byte_order::big) == 0x12345678u);
}

TEST_CASE("byte order - unaligned loads") {
    auto data = bytes({0x00, 0x40, 0x1f, 0x00, 0x00});
    CHECK(load_u32(data.data() + 1, byte_order::little) == 8000);
}

TEST_CASE("byte order - swapping") {
    CHECK(swap16(0x1234) == 0x3412);
    CHECK(swap32(0x12345678u) == 0x78563412u);
    CHECK(swap_byte_order(std::uint8_t(0xAB)) == 0xAB);
    CHECK(swap_byte_order(std::int16_t(0x0102)) == 0x0201);
    CHECK(swap_byte_order(swap_byte_order(0xCAFEBABEu)) == 0xCAFEBABEu);

    CHECK(byte_order_native(byte_order::little) == is_little_endian);
    CHECK(byte_order_native(byte_order::big) == is_big_endian);
    CHECK(is_little_endian != is_big_endian);
}
