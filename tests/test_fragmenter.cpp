#include <doctest/doctest.h>
#include "meshrelay/fragmenter.hpp"

#include <algorithm>
#include <set>

using namespace meshrelay;

static DataUnit big_unit() {
    return DataUnit{
        {"type", "KNOWLEDGE"},
        {"title", "field notes"},
        {"body", std::string(700, 'q')},
        {"refs", {1, 2, 3, 5, 8, 13}},
        {"meta", {{"lang", "en"}, {"utf8", "\xC3\xA9t\xC3\xA9"}}},
    };
}

TEST_CASE("Reassembly round-trips for every chunk size") {
    const DataUnit u = big_unit();
    for (size_t chunk : {1u, 3u, 7u, 64u, 178u, 5000u}) {
        auto frags = fragment(u, chunk);
        REQUIRE_FALSE(frags.empty());
        auto back = reassemble(frags);
        REQUIRE(back.has_value());
        CHECK(*back == u);
    }
}

TEST_CASE("Fragments share a transfer id and carry dense indices") {
    auto frags = fragment(big_unit(), 100);
    REQUIRE(frags.size() > 1);
    std::set<uint32_t> idx;
    for (const auto& f : frags) {
        CHECK(f.transfer_id == frags.front().transfer_id);
        CHECK(f.total == frags.size());
        CHECK(f.chunk.size() <= 100);
        CHECK(f.chunk_hash.size() == 16);
        idx.insert(f.index);
    }
    CHECK(idx.size() == frags.size());
    CHECK(*idx.rbegin() == frags.size() - 1);
}

TEST_CASE("Unit that fits yields a single fragment") {
    auto frags = fragment(DataUnit{{"k", "v"}}, 10000);
    REQUIRE(frags.size() == 1);
    CHECK(frags[0].index == 0);
    CHECK(frags[0].total == 1);
}

TEST_CASE("Arrival order does not matter") {
    auto frags = fragment(big_unit(), 50);
    std::reverse(frags.begin(), frags.end());
    auto back = reassemble(frags);
    REQUIRE(back.has_value());
    CHECK(*back == big_unit());
}

TEST_CASE("Removing any one fragment makes reassembly fail") {
    const auto frags = fragment(big_unit(), 120);
    REQUIRE(frags.size() > 2);
    for (size_t drop = 0; drop < frags.size(); ++drop) {
        FragmentList partial;
        for (size_t i = 0; i < frags.size(); ++i) {
            if (i != drop) partial.push_back(frags[i]);
        }
        CHECK_FALSE(reassemble(partial).has_value());
    }
}

TEST_CASE("Duplicates, mixed transfers and bad chunks are rejected") {
    auto frags = fragment(big_unit(), 200);
    REQUIRE(frags.size() > 2);

    SUBCASE("duplicate index") {
        auto dup = frags;
        dup[1] = dup[0];
        CHECK_FALSE(reassemble(dup).has_value());
    }
    SUBCASE("mixed transfer ids") {
        auto other = fragment(big_unit(), 200);
        auto mixed = frags;
        mixed[0] = other[0];
        CHECK_FALSE(reassemble(mixed).has_value());
    }
    SUBCASE("chunk altered after hashing") {
        auto bad = frags;
        bad[1].chunk[0] = bad[1].chunk[0] == 'q' ? 'r' : 'q';
        CHECK_FALSE(reassemble(bad).has_value());
    }
    SUBCASE("index out of range") {
        auto bad = frags;
        bad.back().index = static_cast<uint32_t>(frags.size() + 4);
        CHECK_FALSE(reassemble(bad).has_value());
    }
}

static bool starts_a_character(const std::string& chunk) {
    return chunk.empty() || (static_cast<unsigned char>(chunk[0]) & 0xC0) != 0x80;
}

TEST_CASE("Cuts never split a multi-byte character") {
    for (size_t pad = 0; pad < 4; ++pad) {
        CAPTURE(pad);
        std::string text(pad, 'a');
        for (int i = 0; i < 60; ++i) text += "\xE2\x82\xAC\xC3\xA9";   // euro sign, e acute
        const DataUnit u{{"t", text}};

        for (size_t chunk : {1u, 2u, 5u, 64u}) {
            CAPTURE(chunk);
            auto frags = fragment(u, chunk);
            for (const auto& f : frags) {
                CHECK(starts_a_character(f.chunk));
                CHECK(f.chunk.size() <= std::max<size_t>(chunk, 3));
                CHECK_NOTHROW(DataUnit(f.chunk).dump());
            }
            auto back = reassemble(frags);
            REQUIRE(back.has_value());
            CHECK(*back == u);
        }
    }
}

TEST_CASE("JSON-string measure keeps each escaped chunk within the limit") {
    std::string text;
    for (int i = 0; i < 80; ++i) text += "\"\\x\n";
    const DataUnit u{{"t", text}, {"ctl", std::string(1, '\x01')}};

    auto raw = fragment(u, 40);
    auto escaped = fragment(u, 40, ChunkMeasure::JsonString);
    CHECK(escaped.size() > raw.size());

    for (const auto& f : escaped) {
        const std::string as_string = DataUnit(f.chunk).dump();
        CHECK(as_string.size() - 2 <= 40);   // minus the surrounding quotes
    }
    auto back = reassemble(escaped);
    REQUIRE(back.has_value());
    CHECK(*back == u);
}

TEST_CASE("Escaped sizes follow JSON string rules") {
    CHECK(json_escaped_size('a') == 1);
    CHECK(json_escaped_size('"') == 2);
    CHECK(json_escaped_size('\\') == 2);
    CHECK(json_escaped_size('\n') == 2);
    CHECK(json_escaped_size(0x01) == 6);
    CHECK(json_escaped_size(0xC3) == 1);
}

TEST_CASE("Null and empty inputs") {
    CHECK(fragment(DataUnit{}, 10).empty());
    CHECK_FALSE(reassemble(nullptr).has_value());
    CHECK_FALSE(reassemble(FragmentList{}).has_value());
}

TEST_CASE("Chunk size zero is treated as one byte") {
    DataUnit u{{"k", "v"}};
    auto frags = fragment(u, 0);
    CHECK(frags.size() == canonical(u).size());
    auto back = reassemble(frags);
    REQUIRE(back.has_value());
    CHECK(*back == u);
}

TEST_CASE("Per-channel chunk size and fragment counting") {
    using transport::Channel;
    CHECK(chunk_size_for(Channel::Lora) == 242 - 64);
    CHECK(chunk_size_for(Channel::RfPacket) == 256 - 64);
    CHECK(chunk_size_for(Channel::Nfc) == 8 * 1024 - 64);
    CHECK(chunk_size_for(Channel::Internet) == 10 * 1024 * 1024 - 64);

    CHECK(fragment_count(0, 100) == 1);
    CHECK(fragment_count(10, 3) == 4);
    CHECK(fragment_count(9, 3) == 3);
    CHECK(fragment_count(5, 0) == 5);
}
