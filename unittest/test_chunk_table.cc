//
// Test the fixed-capacity chunk table
//

#include <doctest/doctest.h>
#include <cstdint>
#include <string>

#include <wav/chunk_table.hh>

using namespace wav;

namespace {
    chunk make_chunk(const char* id, std::uint64_t start, std::uint64_t size) {
        chunk c;
        c.id = fourcc(id);
        c.kind = classify(c.id);
        c.start = start;
        c.end = start + size;
        return c;
    }
}

TEST_CASE("chunk - offsets") {
    auto even = make_chunk("data", 44, 8);
    CHECK(even.size() == 8);
    CHECK(even.next_offset() == 52);

    auto odd = make_chunk("JUNK", 20, 3);
    CHECK(odd.size() == 3);
    CHECK(odd.end == 23);
    CHECK(odd.next_offset() == 24);

    auto empty = make_chunk("LIST", 100, 0);
    CHECK(empty.next_offset() == 100);
}

TEST_CASE("chunk - classification") {
    CHECK(classify("RIFF"_4cc) == chunk_kind::riff);
    CHECK(classify("RIFX"_4cc) == chunk_kind::rifx);
    CHECK(classify("WAVE"_4cc) == chunk_kind::wave);
    CHECK(classify("fmt "_4cc) == chunk_kind::fmt);
    CHECK(classify("data"_4cc) == chunk_kind::data);
    CHECK(classify("fmt"_4cc) == chunk_kind::fmt);   // literal pads with a space
    CHECK(classify("FMT "_4cc) == chunk_kind::unknown);
    CHECK(classify("DATA"_4cc) == chunk_kind::unknown);
    CHECK(classify("LIST"_4cc) == chunk_kind::unknown);
    CHECK(std::string(to_string(chunk_kind::fmt)) == "fmt");
}

TEST_CASE("chunk_table") {
    chunk_table<3> table;

    CHECK(table.empty());
    CHECK(table.capacity() == 3);
    CHECK(table.find(chunk_kind::data) == nullptr);

    CHECK(table.push_back(make_chunk("fmt ", 20, 16)));
    CHECK(table.push_back(make_chunk("LIST", 44, 4)));
    CHECK(table.push_back(make_chunk("data", 56, 100)));
    CHECK(table.full());

    SUBCASE("push_back refuses entries once full") {
        CHECK_FALSE(table.push_back(make_chunk("JUNK", 164, 2)));
        CHECK(table.size() == 3);
        CHECK(table[2].kind == chunk_kind::data);
    }

    SUBCASE("find returns the first chunk of a kind") {
        const chunk* d = table.find(chunk_kind::data);
        REQUIRE(d != nullptr);
        CHECK(d->start == 56);
        CHECK(table.find(chunk_kind::riff) == nullptr);
    }

    SUBCASE("iteration keeps file order") {
        std::uint64_t last = 0;
        std::size_t count = 0;
        for (const auto& c : table) {
            CHECK(c.start > last);
            last = c.start;
            count++;
        }
        CHECK(count == 3);
    }

    SUBCASE("clear makes room again") {
        table.clear();
        CHECK(table.empty());
        CHECK(table.push_back(make_chunk("data", 44, 8)));
    }
}

TEST_CASE("chunk_list over external storage") {
    chunk storage[2];
    chunk_list list(storage, 2);
    CHECK(list.push_back(make_chunk("fmt ", 20, 16)));
    CHECK(list.push_back(make_chunk("data", 44, 8)));
    CHECK_FALSE(list.push_back(make_chunk("LIST", 52, 8)));
    CHECK(storage[1].kind == chunk_kind::data);
}

TEST_CASE("chunk_table keeps its entries inline") {
    chunk_table<4> first;
    chunk_table<4> second;

    CHECK(first.push_back(make_chunk("fmt ", 20, 16)));
    CHECK(second.push_back(make_chunk("data", 44, 8)));

    CHECK(first[0].kind == chunk_kind::fmt);
    CHECK(second[0].kind == chunk_kind::data);

    auto begin = reinterpret_cast<std::uintptr_t>(&first);
    auto entry = reinterpret_cast<std::uintptr_t>(&first[0]);
    CHECK(entry >= begin);
    CHECK(entry + sizeof(chunk) <= begin + sizeof(first));
}
