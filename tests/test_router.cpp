#include <doctest/doctest.h>
#include "meshrelay/router.hpp"

#include <memory>

using namespace meshrelay;
using transport::Channel;
using transport::ChannelSet;

static transport::TransportRegistry registry_with(const ChannelSet& set) {
    return transport::TransportRegistry(std::make_shared<transport::StaticProbe>(set));
}

TEST_CASE("No usable channel means store and forward") {
    auto reg = registry_with(ChannelSet{});
    auto d = select_route(100, {}, reg);
    CHECK_FALSE(d.channel.has_value());
    CHECK(d.mode == RouteMode::StoreForward);
    CHECK(d.reason == "no_channels_available");
}

TEST_CASE("Default node routes small units over the internet") {
    transport::TransportRegistry reg;
    auto d = select_route(200, {}, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::Internet);
    CHECK(d.mode == RouteMode::Direct);
    CHECK_FALSE(d.needs_fragmentation);
    CHECK(d.fragment_count == 1);
    CHECK(d.score == 70);
    CHECK(d.reason == "optimal_route_internet");
    CHECK(d.alternates.empty());
}

TEST_CASE("Lower channel priority scores higher") {
    auto reg = registry_with(ChannelSet{Channel::Internet, Channel::Bluetooth, Channel::Lora});
    auto d = select_route(100, {}, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::Bluetooth);
    CHECK(d.score == 90);
    REQUIRE(d.alternates.size() == 2);
    CHECK(d.alternates[0] == Channel::Internet);
    CHECK(d.alternates[1] == Channel::Lora);
}

TEST_CASE("Alternates are capped at two") {
    ChannelSet all;
    for (size_t i = 0; i < transport::CHANNEL_COUNT; ++i) all.push_back(static_cast<Channel>(i));
    auto reg = registry_with(all);
    RouteOptions opts;
    opts.proximity = Proximity::Local;
    auto d = select_route(100, opts, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::Bluetooth);   // 90 + 50
    CHECK(d.alternates.size() == 2);
}

TEST_CASE("Oversize payload on a small radio needs fragmentation") {
    auto reg = registry_with(ChannelSet{Channel::Lora});
    auto d = select_route(1000, {}, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::Lora);
    CHECK(d.mode == RouteMode::Fragmented);
    CHECK(d.needs_fragmentation);
    CHECK(d.fragment_count == 6);   // ceil(1000 / 178)
    CHECK(d.score == 60 - 20);
}

TEST_CASE("Channels needing more than 255 fragments are excluded") {
    auto reg = registry_with(ChannelSet{Channel::Lora});
    auto d = select_route(100000, {}, reg);
    CHECK_FALSE(d.channel.has_value());
    CHECK(d.mode == RouteMode::StoreForward);
}

TEST_CASE("Oversize penalty can flip the choice") {
    auto reg = registry_with(ChannelSet{Channel::Bluetooth, Channel::WifiDirect});
    auto d = select_route(600 * 1024, {}, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::WifiDirect);   // 80 beats 90 - 20
    CHECK(d.mode == RouteMode::Direct);
}

TEST_CASE("NFC needs local proximity or a threat") {
    auto reg = registry_with(ChannelSet{Channel::Nfc});

    auto none = select_route(100, {}, reg);
    CHECK_FALSE(none.channel.has_value());

    RouteOptions local;
    local.proximity = Proximity::Local;
    auto l = select_route(100, local, reg);
    REQUIRE(l.channel.has_value());
    CHECK(*l.channel == Channel::Nfc);
    CHECK(l.score == 30 + 50);

    RouteOptions threat;
    threat.priority_class = RelayClass::Threat;
    auto t = select_route(100, threat, reg);
    REQUIRE(t.channel.has_value());
    CHECK(*t.channel == Channel::Nfc);
}

TEST_CASE("Nearby proximity favours wifi direct") {
    auto reg = registry_with(ChannelSet{Channel::Bluetooth, Channel::WifiDirect});
    RouteOptions opts;
    opts.proximity = Proximity::Nearby;
    auto d = select_route(100, opts, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::WifiDirect);
    CHECK(d.score == 110);
}

TEST_CASE("Threat class rewards fast channels") {
    auto reg = registry_with(ChannelSet{Channel::Internet, Channel::Lora});
    RouteOptions opts;
    opts.priority_class = RelayClass::Threat;
    auto d = select_route(100, opts, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::Internet);
    CHECK(d.score == 90);
}

TEST_CASE("Measured low latency earns a bonus") {
    auto reg = registry_with(ChannelSet{Channel::Bluetooth, Channel::WifiDirect});
    reg.set_latency_ms(Channel::WifiDirect, 12);
    auto d = select_route(100, {}, reg);
    REQUIRE(d.channel.has_value());
    CHECK(*d.channel == Channel::WifiDirect);
    CHECK(d.score == 95);

    reg.set_latency_ms(Channel::WifiDirect, 50);   // not below the threshold
    auto e = select_route(100, {}, reg);
    REQUIRE(e.channel.has_value());
    CHECK(*e.channel == Channel::Bluetooth);
}

TEST_CASE("Proximity names parse") {
    CHECK(proximity_from_string("local") == Proximity::Local);
    CHECK(proximity_from_string("nearby") == Proximity::Nearby);
    CHECK(proximity_from_string("") == Proximity::None);
    CHECK_FALSE(proximity_from_string("far").has_value());
    CHECK(std::string(to_string(RouteMode::StoreForward)) == "store_forward");
}
