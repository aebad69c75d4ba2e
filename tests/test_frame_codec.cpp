#include <doctest/doctest.h>
#include "meshrelay/frame_codec.hpp"

using namespace meshrelay;

static DataUnit sample_unit() {
    return DataUnit{{"type", "NOTE"}, {"body", "hello mesh"}, {"tags", {"a", "b"}}};
}

TEST_CASE("Frame round-trip preserves the unit and flags") {
    FrameOptions opts;
    opts.priority = 5;
    opts.relay = true;
    opts.encrypted = true;
    opts.source_node = "node_alpha";

    auto frame = encode_frame(sample_unit(), opts);
    REQUIRE(frame.has_value());
    CHECK(frame->total_bytes() == FRAME_OVERHEAD + frame->payload_length());

    const auto bytes = frame->pack();
    CHECK(bytes.size() == frame->total_bytes());

    auto r = decode_frame(bytes);
    REQUIRE(r.ok);
    CHECK(r.error == MeshError::None);
    CHECK(r.unit == sample_unit());
    CHECK(r.relay == true);
    CHECK(r.encrypted == true);
    CHECK(r.emergency == false);
    CHECK(r.fragment == false);
    CHECK(r.frame.priority == Urgency::Low);
    CHECK(r.frame.source == frame->source);
    CHECK(r.frame.crc == frame->crc);
}

TEST_CASE("Wire header carries magic 0xCD01 and version 1") {
    auto frame = encode_frame(sample_unit());
    REQUIRE(frame.has_value());
    const auto bytes = frame->pack();
    REQUIRE(bytes.size() > FRAME_OVERHEAD);
    CHECK(bytes[0] == 0xCD);
    CHECK(bytes[1] == 0x01);
    CHECK(bytes[2] == 1);
}

TEST_CASE("Priority is clamped and urgent levels force the emergency flag") {
    FrameOptions hi;
    hi.priority = -3;
    auto f0 = encode_frame(sample_unit(), hi);
    REQUIRE(f0.has_value());
    CHECK(f0->priority == Urgency::Emergency);
    CHECK(f0->flags.emergency());

    FrameOptions threat;
    threat.priority = 1;
    auto f1 = encode_frame(sample_unit(), threat);
    REQUIRE(f1.has_value());
    CHECK(f1->flags.emergency());

    FrameOptions lo;
    lo.priority = 42;
    auto f7 = encode_frame(sample_unit(), lo);
    REQUIRE(f7.has_value());
    CHECK(f7->priority == Urgency::Minimal);
    CHECK_FALSE(f7->flags.emergency());
}

TEST_CASE("Fragment total above one sets the fragment flag") {
    FrameOptions opts;
    opts.fragment_seq = 1;
    opts.fragment_total = 3;
    auto f = encode_frame(sample_unit(), opts);
    REQUIRE(f.has_value());
    CHECK(f->flags.fragment());

    auto r = decode_frame(f->pack());
    REQUIRE(r.ok);
    CHECK(r.fragment);
    CHECK(r.frame.fragment_seq == 1);
    CHECK(r.frame.fragment_total == 3);
}

TEST_CASE("Altered magic is reported as invalid_magic") {
    auto f = encode_frame(sample_unit());
    REQUIRE(f.has_value());
    auto bytes = f->pack();
    bytes[0] ^= 0xFF;

    auto r = decode_frame(bytes);
    CHECK_FALSE(r.ok);
    CHECK(r.error == MeshError::InvalidMagic);
    CHECK(std::string(to_string(r.error)) == "invalid_magic");
}

TEST_CASE("Corrupted payload byte is reported as crc_mismatch") {
    auto f = encode_frame(sample_unit());
    REQUIRE(f.has_value());
    auto bytes = f->pack();
    bytes[FRAME_HEADER_SIZE + 2] ^= 0x20;

    auto r = decode_frame(bytes);
    CHECK_FALSE(r.ok);
    CHECK(r.error == MeshError::CrcMismatch);
}

TEST_CASE("Corrupted header byte is caught by the CRC too") {
    auto f = encode_frame(sample_unit());
    REQUIRE(f.has_value());
    auto bytes = f->pack();
    bytes[4] ^= 0x01;   // ttl

    CHECK(decode_frame(bytes).error == MeshError::CrcMismatch);
}

TEST_CASE("Null, short and mis-sized input never crash") {
    CHECK(decode_frame(nullptr, 10).error == MeshError::MissingRequiredInput);
    CHECK(decode_frame(std::vector<uint8_t>{}).error == MeshError::TruncatedFrame);

    auto f = encode_frame(sample_unit());
    REQUIRE(f.has_value());
    auto bytes = f->pack();

    auto cut = bytes;
    cut.pop_back();
    CHECK(decode_frame(cut).error == MeshError::TruncatedFrame);

    auto header_only = std::vector<uint8_t>(bytes.begin(), bytes.begin() + 10);
    CHECK(decode_frame(header_only).error == MeshError::TruncatedFrame);
}

TEST_CASE("Unknown version is rejected before the CRC check") {
    auto f = encode_frame(sample_unit());
    REQUIRE(f.has_value());
    auto bytes = f->pack();
    bytes[2] = 9;
    CHECK(decode_frame(bytes).error == MeshError::UnsupportedVersion);
}

TEST_CASE("Encoding a null unit yields nothing") {
    CHECK_FALSE(encode_frame(DataUnit{}).has_value());
}

TEST_CASE("Valid CRC over a non-JSON payload is malformed_payload") {
    Frame f;
    f.payload = "{not json";
    f.crc = f.compute_crc();
    auto r = decode_frame(f.pack());
    CHECK_FALSE(r.ok);
    CHECK(r.error == MeshError::MalformedPayload);
}
