#include <doctest/doctest.h>
#include "meshrelay/packet.hpp"
#include "meshrelay/digest.hpp"

using namespace meshrelay;

TEST_CASE("Packet total bytes cover payload plus the 64-byte overhead") {
    const DataUnit units[] = {
        DataUnit::object(),
        DataUnit("bare string"),
        DataUnit{{"type", "NOTE"}, {"body", std::string(500, 'x')}},
        DataUnit{{"nested", {{"a", {1, 2, 3}}, {"b", nullptr}}}},
    };
    for (const auto& u : units) {
        auto p = build_packet(u, "node_b");
        REQUIRE(p.has_value());
        CHECK(p->total_bytes() >= p->payload_bytes() + 64);
        CHECK(p->total_bytes() == p->payload_bytes() + PACKET_OVERHEAD);
    }
}

TEST_CASE("Packet hash is SHA-256 of the canonical payload and verifies") {
    DataUnit u{{"z", 1}, {"a", 2}};
    auto p = build_packet(u, "node_b");
    REQUIRE(p.has_value());
    CHECK(p->payload == canonical(u));
    CHECK(p->payload_hash == sha256_hex(p->payload));
    CHECK(p->payload_hash.size() == 64);
    CHECK(p->verify());
    CHECK(p->status == PacketStatus::Pending);
    CHECK(p->id.rfind("pkt_", 0) == 0);

    auto back = p->unit();
    REQUIRE(back.has_value());
    CHECK(*back == u);
}

TEST_CASE("Tampered payload no longer verifies") {
    auto p = build_packet(DataUnit{{"body", "genuine"}}, "node_b");
    REQUIRE(p.has_value());
    p->payload = canonical(DataUnit{{"body", "altered"}});
    CHECK_FALSE(p->verify());
}

TEST_CASE("Null unit builds nothing") {
    CHECK_FALSE(build_packet(DataUnit{}, "node_b").has_value());
}

TEST_CASE("Empty destination becomes broadcast") {
    auto p = build_packet(DataUnit{{"k", "v"}}, "");
    REQUIRE(p.has_value());
    CHECK(p->destination_id == BROADCAST);
    CHECK(p->header.is_broadcast());
}

TEST_CASE("Urgency follows the explicit option, then the class") {
    PacketOptions by_class;
    by_class.priority_class = RelayClass::Economic;
    auto a = build_packet(DataUnit{{"k", 1}}, "node_b", by_class);
    REQUIRE(a.has_value());
    CHECK(a->urgency == Urgency::Economic);
    CHECK_FALSE(a->header.flags.priority_boost());

    PacketOptions explicit_urgency;
    explicit_urgency.priority_class = RelayClass::General;
    explicit_urgency.urgency = Urgency::Emergency;
    auto b = build_packet(DataUnit{{"k", 1}}, "node_b", explicit_urgency);
    REQUIRE(b.has_value());
    CHECK(b->urgency == Urgency::Emergency);
    CHECK(b->header.flags.priority_boost());

    auto c = build_packet(DataUnit{{"k", 1}}, "node_b");
    REQUIRE(c.has_value());
    CHECK(c->urgency == Urgency::General);
    CHECK_FALSE(c->priority_class.has_value());
}

TEST_CASE("Header fields are clamped from packet options") {
    PacketOptions opts;
    opts.ttl = 300;
    opts.store_forward = true;
    opts.source_id = "node_a";
    auto p = build_packet(DataUnit{{"k", 1}}, "node_b", opts);
    REQUIRE(p.has_value());
    CHECK(p->header.ttl == 255);
    CHECK(p->header.flags.store_forward());
    CHECK(p->header.source == short_node_id("node_a"));

    opts.ttl = -5;
    auto q = build_packet(DataUnit{{"k", 1}}, "node_b", opts);
    REQUIRE(q.has_value());
    CHECK(q->header.ttl == 0);
}

TEST_CASE("Identical units produce identical hashes but distinct ids") {
    DataUnit u{{"type", "NOTE"}, {"body", "same"}};
    auto a = build_packet(u, "node_b");
    auto b = build_packet(u, "node_b");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->payload_hash == b->payload_hash);
    CHECK(a->id != b->id);
}
