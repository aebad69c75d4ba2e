#include <doctest/doctest.h>
#include "meshrelay/transport/transport_registry.hpp"

#include <memory>
#include <string>

using namespace meshrelay;
using transport::Channel;
using transport::ChannelSet;

TEST_CASE("Capability table has seven channels with stable keys") {
    const char* keys[] = {"internet", "wifi_direct", "bluetooth", "lora", "rf_packet", "telephone", "nfc"};
    for (size_t i = 0; i < transport::CHANNEL_COUNT; ++i) {
        const auto& s = transport::all_profiles()[i];
        CHECK(static_cast<size_t>(s.channel) == i);
        CHECK(std::string(s.key) == keys[i]);
        auto back = transport::channel_from_string(keys[i]);
        REQUIRE(back.has_value());
        CHECK(*back == s.channel);
    }
    CHECK_FALSE(transport::channel_from_string("carrier_pigeon").has_value());

    CHECK(transport::profile(Channel::Lora).max_payload_bytes == 242);
    CHECK(transport::profile(Channel::Bluetooth).priority == 1);
    CHECK(transport::profile(Channel::Nfc).proximity_only);
    CHECK_FALSE(transport::profile(Channel::Internet).proximity_only);
}

TEST_CASE("Default node sees only the internet") {
    transport::TransportRegistry reg;
    CHECK(reg.available(Channel::Internet));
    CHECK_FALSE(reg.available(Channel::Lora));
    CHECK(reg.any_available());

    auto chans = reg.available_channels();
    REQUIRE(chans.size() == 1);
    CHECK(chans[0] == Channel::Internet);

    auto report = reg.status_report();
    CHECK(report.size() == transport::CHANNEL_COUNT);
    size_t up = 0;
    for (const auto& st : report) {
        REQUIRE(st.profile != nullptr);
        if (st.available) ++up;
    }
    CHECK(up == 1);
}

TEST_CASE("Available channels come back in preference order") {
    transport::TransportRegistry reg(std::make_shared<transport::StaticProbe>(
        ChannelSet{Channel::Lora, Channel::Internet, Channel::Bluetooth}));
    auto chans = reg.available_channels();
    REQUIRE(chans.size() == 3);
    CHECK(chans[0] == Channel::Bluetooth);
    CHECK(chans[1] == Channel::Internet);
    CHECK(chans[2] == Channel::Lora);
}

TEST_CASE("Manual flags hold until the next probe") {
    transport::TransportRegistry reg(std::make_shared<transport::StaticProbe>(ChannelSet{}));
    CHECK_FALSE(reg.any_available());

    reg.set_available(Channel::Telephone, true);
    CHECK(reg.available(Channel::Telephone));
    CHECK(reg.any_available());

    auto flags = reg.probe();
    CHECK_FALSE(flags[static_cast<size_t>(Channel::Telephone)]);
    CHECK_FALSE(reg.available(Channel::Telephone));
}

TEST_CASE("Swapping the probe takes effect on the next refresh") {
    transport::TransportRegistry reg;
    reg.set_probe(std::make_shared<transport::StaticProbe>(ChannelSet{Channel::Nfc}));
    CHECK(reg.available(Channel::Internet));
    reg.probe();
    CHECK_FALSE(reg.available(Channel::Internet));
    CHECK(reg.available(Channel::Nfc));
}

TEST_CASE("Latency is recorded per channel") {
    transport::TransportRegistry reg;
    CHECK_FALSE(reg.latency_ms(Channel::Internet).has_value());
    reg.set_latency_ms(Channel::Internet, 35);
    REQUIRE(reg.latency_ms(Channel::Internet).has_value());
    CHECK(*reg.latency_ms(Channel::Internet) == 35);
}

TEST_CASE("Channel sets never hold a kind twice") {
    ChannelSet s;
    transport::insert_unique(s, Channel::Lora);
    transport::insert_unique(s, Channel::Lora);
    transport::insert_unique(s, Channel::Nfc);
    CHECK(s.size() == 2);
    CHECK(transport::contains(s, Channel::Nfc));
}
