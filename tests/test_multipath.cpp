#include <doctest/doctest.h>
#include "meshrelay/multipath.hpp"

#include <set>

using namespace meshrelay;
using transport::Channel;
using transport::ChannelSet;

static std::vector<DataUnit> components(int n) {
    std::vector<DataUnit> out;
    for (int i = 0; i < n; ++i) out.push_back(DataUnit{{"i", i}});
    return out;
}

TEST_CASE("Empty component list is rejected") {
    auto plan = plan_multi_path(std::vector<DataUnit>{}, ChannelSet{Channel::Internet});
    CHECK_FALSE(plan.ok);
    CHECK(plan.error == MeshError::NoComponents);

    auto null_plan = plan_multi_path(nullptr, ChannelSet{Channel::Internet});
    CHECK(null_plan.error == MeshError::NoComponents);
}

TEST_CASE("No usable channel is rejected") {
    auto plan = plan_multi_path(components(3), ChannelSet{});
    CHECK_FALSE(plan.ok);
    CHECK(plan.error == MeshError::NoChannelsAvailable);
    CHECK(plan.reason == "no_channels_available");
}

TEST_CASE("Single channel takes everything") {
    auto plan = plan_multi_path(components(9), ChannelSet{Channel::Lora});
    REQUIRE(plan.ok);
    REQUIRE(plan.paths.size() == 1);
    CHECK(plan.paths[0].components.size() == 9);
    CHECK(plan.paths[0].estimated_latency == LatencyClass::High);
    CHECK(plan.reason == "single_path");
}

TEST_CASE("Shares follow bandwidth and leftovers ride the widest path") {
    auto plan = plan_multi_path(components(10),
                                ChannelSet{Channel::Lora, Channel::Bluetooth, Channel::Internet});
    REQUIRE(plan.ok);
    CHECK(plan.reason == "multi_path_distribution");
    CHECK(plan.total_components == 10);
    REQUIRE(plan.paths.size() == 3);

    CHECK(plan.paths[0].channel == Channel::Internet);
    CHECK(plan.paths[0].components.size() == 4 + 3);
    CHECK(plan.paths[0].estimated_latency == LatencyClass::Low);

    CHECK(plan.paths[1].channel == Channel::Bluetooth);
    CHECK(plan.paths[1].components.size() == 2);
    CHECK(plan.paths[1].estimated_latency == LatencyClass::Medium);

    CHECK(plan.paths[2].channel == Channel::Lora);
    CHECK(plan.paths[2].components.size() == 1);
}

TEST_CASE("Every component is assigned exactly once") {
    for (int n : {1, 2, 5, 7, 23}) {
        auto plan = plan_multi_path(components(n),
                                    ChannelSet{Channel::WifiDirect, Channel::Telephone, Channel::Bluetooth});
        REQUIRE(plan.ok);
        std::multiset<int> seen;
        for (const auto& p : plan.paths) {
            for (const auto& c : p.components) seen.insert(c["i"].get<int>());
        }
        CHECK(seen.size() == static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) CHECK(seen.count(i) == 1);
    }
}

TEST_CASE("Few components use only the first paths") {
    auto plan = plan_multi_path(components(2), ChannelSet{Channel::Internet, Channel::Lora});
    REQUIRE(plan.ok);
    CHECK(plan.channels_used() == 1);
    CHECK(plan.reason == "single_path");
}
