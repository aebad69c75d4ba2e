#include <doctest/doctest.h>
#include "meshrelay/relay_queue.hpp"

#include <limits>
#include <vector>

using namespace meshrelay;
using transport::Channel;

static Packet packet_of(const DataUnit& u, std::optional<RelayClass> cls = std::nullopt) {
    PacketOptions opts;
    opts.priority_class = cls;
    auto p = build_packet(u, "node_b", opts);
    REQUIRE(p.has_value());
    return *p;
}

static EnqueueOptions with_class(RelayClass c) {
    EnqueueOptions o;
    o.priority_class = c;
    return o;
}

static const RelayQueue::Reachability always_internet =
    [](const std::string&) -> std::optional<Channel> { return Channel::Internet; };
static const RelayQueue::Reachability never =
    [](const std::string&) -> std::optional<Channel> { return std::nullopt; };

TEST_CASE("Configuration is clamped to the queue limits") {
    RelayQueue q;
    RelayConfigUpdate big;
    big.max_queue_size = 99999;
    big.max_hold_time_ms = 1000;
    auto cfg = q.configure(big);
    CHECK(cfg.max_queue_size == 10000);
    CHECK(cfg.max_hold_time_ms == 60000);

    RelayConfigUpdate small;
    small.max_queue_size = 1;
    small.max_hold_time_ms = int64_t(30) * 24 * 3600 * 1000;
    cfg = q.configure(small);
    CHECK(cfg.max_queue_size == RELAY_QUEUE_MIN);
    CHECK(cfg.max_hold_time_ms == RELAY_HOLD_CAP_MS);
    CHECK(cfg.enabled);    // untouched field keeps its value
}

TEST_CASE("Dequeue order is non-decreasing in class and FIFO within a class") {
    RelayQueue q;
    const RelayClass order[] = {RelayClass::General, RelayClass::Threat, RelayClass::Knowledge,
                                RelayClass::General, RelayClass::Economic, RelayClass::Threat,
                                RelayClass::Consciousness};
    std::vector<std::string> ids;
    uint64_t now = 1000;
    for (auto c : order) {
        auto p = packet_of(DataUnit{{"n", ids.size()}});
        auto r = q.enqueue(&p, "node_b", with_class(c), now++);
        REQUIRE(r.queued);
        ids.push_back(r.relay_id);
    }

    std::vector<RelayEntry> out;
    while (auto e = q.dequeue()) out.push_back(*e);
    REQUIRE(out.size() == ids.size());
    for (size_t i = 1; i < out.size(); ++i) {
        CHECK(static_cast<int>(out[i - 1].priority_class) <= static_cast<int>(out[i].priority_class));
    }
    // the two threats kept arrival order
    CHECK(out[0].id == ids[1]);
    CHECK(out[1].id == ids[5]);
    CHECK(out.back().priority_class == RelayClass::General);
    CHECK(out.back().id == ids[3]);
}

TEST_CASE("Reachable destination drains fully") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    REQUIRE(q.enqueue(&p, "node_remote", {}, 1000).queued);

    std::vector<std::string> delivered_to;
    auto rep = q.drain(2000, always_internet, [&](const RelayEntry& e, Channel ch) {
        CHECK(ch == Channel::Internet);
        delivered_to.push_back(e.destination_id);
        return true;
    });
    CHECK(rep.delivered == 1);
    CHECK(rep.remaining == 0);
    CHECK(rep.expired == 0);
    REQUIRE(delivered_to.size() == 1);
    CHECK(delivered_to[0] == "node_remote");
}

TEST_CASE("Negative hold expires on the next drain") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    EnqueueOptions opts;
    opts.hold_time_ms = -1000;
    auto r = q.enqueue(&p, "node_remote", opts, 5000);
    REQUIRE(r.queued);
    CHECK(r.expires_at_ms == 4000);

    auto rep = q.drain(5000, always_internet);
    CHECK(rep.expired == 1);
    CHECK(rep.delivered == 0);
    CHECK(rep.remaining == 0);
}

TEST_CASE("Default hold is the configured maximum") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    auto r = q.enqueue(&p, "node_remote", {}, 1000);
    CHECK(r.expires_at_ms == 1000 + RELAY_HOLD_DEFAULT_MS);
}

TEST_CASE("Per-entry hold is capped like the configured one") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    EnqueueOptions opts;
    opts.hold_time_ms = std::numeric_limits<int64_t>::max();
    auto r = q.enqueue(&p, "node_remote", opts, 1000);
    REQUIRE(r.queued);
    CHECK(r.expires_at_ms == 1000 + RELAY_HOLD_CAP_MS);

    opts.hold_time_ms = std::numeric_limits<int64_t>::min();
    auto gone = q.enqueue(&p, "node_remote", opts, 1000);
    REQUIRE(gone.queued);
    CHECK(gone.expires_at_ms < 0);
    CHECK(q.drain(1000, always_internet).expired == 1);
}

TEST_CASE("Unreachable entries stay without spending attempts") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    q.enqueue(&p, "node_far", {}, 1000);
    auto rep = q.drain(2000, never);
    CHECK(rep.remaining == 1);
    CHECK(rep.delivered == 0);
    auto pend = q.pending();
    REQUIRE(pend.size() == 1);
    CHECK(pend[0].attempts == 0);
}

TEST_CASE("Refused deliveries count attempts until the entry fails") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    EnqueueOptions opts;
    opts.max_attempts = 2;
    q.enqueue(&p, "node_remote", opts, 1000);

    auto refuse = [](const RelayEntry&, Channel) { return false; };
    auto first = q.drain(2000, always_internet, refuse);
    CHECK(first.remaining == 1);
    CHECK(first.failed == 0);
    CHECK(q.pending()[0].attempts == 1);

    auto second = q.drain(3000, always_internet, refuse);
    CHECK(second.failed == 1);
    CHECK(second.remaining == 0);
}

TEST_CASE("Disabled relay and null packet are refused") {
    RelayQueue q;
    CHECK(q.enqueue(nullptr, "node_b", {}, 1).error == MeshError::MissingRequiredInput);

    RelayConfigUpdate off;
    off.enabled = false;
    q.configure(off);
    auto p = packet_of(DataUnit{{"k", "v"}});
    auto r = q.enqueue(&p, "node_b", {}, 1);
    CHECK_FALSE(r.queued);
    CHECK(r.error == MeshError::RelayDisabled);
    CHECK(q.size() == 0);
}

TEST_CASE("Full queue drops whichever entry ranks last") {
    RelayConfig cfg;
    cfg.max_queue_size = RELAY_QUEUE_MIN;
    RelayQueue q(cfg);

    std::string last_general;
    for (size_t i = 0; i < RELAY_QUEUE_MIN; ++i) {
        auto p = packet_of(DataUnit{{"n", i}});
        auto r = q.enqueue(&p, "node_b", with_class(RelayClass::General), 1000 + i);
        REQUIRE(r.queued);
        last_general = r.relay_id;
    }

    auto extra = packet_of(DataUnit{{"n", "extra"}});
    auto refused = q.enqueue(&extra, "node_b", with_class(RelayClass::General), 2000);
    CHECK_FALSE(refused.queued);
    CHECK(refused.error == MeshError::QueueFull);
    CHECK(q.size() == RELAY_QUEUE_MIN);

    auto urgent = packet_of(DataUnit{{"n", "urgent"}});
    auto taken = q.enqueue(&urgent, "node_b", with_class(RelayClass::Threat), 2001);
    CHECK(taken.queued);
    CHECK(taken.evicted_id == last_general);
    CHECK(q.size() == RELAY_QUEUE_MIN);
    CHECK(q.pending(1)[0].priority_class == RelayClass::Threat);
}

TEST_CASE("Lowering the ceiling trims the tail at once") {
    RelayQueue q;
    for (int i = 0; i < 15; ++i) {
        auto p = packet_of(DataUnit{{"n", i}});
        q.enqueue(&p, "node_b", {}, 1000);
    }
    RelayConfigUpdate shrink;
    shrink.max_queue_size = 10;
    q.configure(shrink);
    CHECK(q.size() == 10);
}

TEST_CASE("Class comes from the option, then the packet, then the payload") {
    RelayQueue q;

    auto threat = packet_of(DataUnit{{"type", "THREAT"}});
    CHECK(q.enqueue(&threat, "node_b", {}, 1).priority_class == RelayClass::Threat);

    auto trade = packet_of(DataUnit{{"type", "TRANSACTION"}});
    CHECK(q.enqueue(&trade, "node_b", {}, 1).priority_class == RelayClass::Economic);

    auto plain = packet_of(DataUnit{{"note", "x"}});
    CHECK(q.enqueue(&plain, "node_b", {}, 1).priority_class == RelayClass::General);

    auto tagged = packet_of(DataUnit{{"type", "THREAT"}}, RelayClass::Knowledge);
    CHECK(q.enqueue(&tagged, "node_b", {}, 1).priority_class == RelayClass::Knowledge);

    auto forced = packet_of(DataUnit{{"type", "THREAT"}}, RelayClass::Knowledge);
    CHECK(q.enqueue(&forced, "node_b", with_class(RelayClass::Economic), 1).priority_class
          == RelayClass::Economic);
}

TEST_CASE("Stored packets carry the store-and-forward flag") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    CHECK_FALSE(p.header.flags.store_forward());
    q.enqueue(&p, "", {}, 1);
    auto head = q.dequeue();
    REQUIRE(head.has_value());
    CHECK(head->packet.header.flags.store_forward());
    CHECK(head->destination_id == BROADCAST);
}

TEST_CASE("Remove by relay id") {
    RelayQueue q;
    auto p = packet_of(DataUnit{{"k", "v"}});
    auto r = q.enqueue(&p, "node_b", {}, 1);
    CHECK(q.remove(r.relay_id));
    CHECK_FALSE(q.remove(r.relay_id));
    CHECK(q.size() == 0);
}
