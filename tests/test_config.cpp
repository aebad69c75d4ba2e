#include <doctest/doctest.h>
#include "meshrelay/config.hpp"
#include "meshrelay/digest.hpp"
#include "meshrelay/json_codec.hpp"

#include <filesystem>
#include <fstream>

using namespace meshrelay;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("Relay limits in a config file are clamped") {
    auto cfg = config::from_json(json::parse(R"({
        "relay": { "enabled": false, "maxQueueSize": 99999, "holdTimeMs": 1000 }
    })"));
    CHECK_FALSE(cfg.relay.enabled);
    CHECK(cfg.relay.max_queue_size == 10000);
    CHECK(cfg.relay.max_hold_time_ms == 60000);

    auto alias = config::from_json(json::parse(R"({ "relay": { "maxHoldTimeMs": 7200000 } })"));
    CHECK(alias.relay.max_hold_time_ms == 7200000);
    CHECK(alias.relay.max_queue_size == RELAY_QUEUE_DEFAULT);
}

TEST_CASE("Wrongly typed fields fall back to defaults") {
    auto cfg = config::from_json(json::parse(R"({
        "nodeId": 42,
        "relay": { "enabled": "yes", "maxQueueSize": "lots" },
        "stalePeerWindowMs": -1,
        "channels": "internet"
    })"));
    CHECK(cfg.node_id.empty());
    CHECK(cfg.relay.enabled);
    CHECK(cfg.relay.max_queue_size == RELAY_QUEUE_DEFAULT);
    CHECK(cfg.stale_peer_window_ms == STALE_PEER_WINDOW_MS);
    CHECK_FALSE(cfg.channels.has_value());

    auto not_object = config::from_json(json::parse("[1,2,3]"));
    CHECK(not_object.relay.max_queue_size == RELAY_QUEUE_DEFAULT);
}

TEST_CASE("Channel list, identity and log level are read") {
    auto cfg = config::from_json(json::parse(R"({
        "nodeId": "node_fixed01",
        "channels": ["lora", "bluetooth"],
        "logLevel": "debug",
        "stalePeerWindowMs": 5000,
        "peersFile": "/tmp/peers.json"
    })"));
    CHECK(cfg.node_id == "node_fixed01");
    REQUIRE(cfg.channels.has_value());
    CHECK(cfg.channels->size() == 2);
    CHECK(transport::contains(*cfg.channels, transport::Channel::Lora));
    CHECK(cfg.log_level == LogLevel::Debug);
    CHECK(cfg.stale_peer_window_ms == 5000);
    CHECK(cfg.peers_file == "/tmp/peers.json");

    auto unknown = config::from_json(json::parse(R"({ "channels": ["lora", "smoke_signal"] })"));
    CHECK_FALSE(unknown.channels.has_value());

    auto empty = config::from_json(json::parse(R"({ "channels": [] })"));
    REQUIRE(empty.channels.has_value());
    CHECK(empty.channels->empty());
}

TEST_CASE("Config survives a save and load") {
    const auto dir = fs::temp_directory_path() / ("meshrelay_cfg_" + random_hex(8));
    const auto file = dir / "config.json";

    bool found = true;
    auto missing = config::load(file, &found);
    CHECK_FALSE(found);
    CHECK(missing.relay.enabled);

    MeshConfig cfg;
    cfg.node_id = "node_saved";
    cfg.relay.max_queue_size = 250;
    cfg.channels = transport::ChannelSet{transport::Channel::Internet, transport::Channel::Nfc};
    cfg.log_level = LogLevel::Warn;
    REQUIRE(config::save(file, cfg));

    auto back = config::load(file, &found);
    CHECK(found);
    CHECK(back.node_id == "node_saved");
    CHECK(back.relay.max_queue_size == 250);
    REQUIRE(back.channels.has_value());
    CHECK(back.channels->size() == 2);
    CHECK(back.log_level == LogLevel::Warn);

    fs::remove_all(dir);
}

TEST_CASE("Malformed config file gives defaults") {
    const auto dir = fs::temp_directory_path() / ("meshrelay_cfg_" + random_hex(8));
    fs::create_directories(dir);
    const auto file = dir / "config.json";
    {
        std::ofstream out(file);
        out << "{ relay: nope";
    }
    bool found = false;
    auto cfg = config::load(file, &found);
    CHECK(found);
    CHECK(cfg.relay.max_queue_size == RELAY_QUEUE_DEFAULT);
    fs::remove_all(dir);
}

TEST_CASE("Peer records with a wrongly typed field are rejected whole") {
    auto good = codec::peer_from_json(json::parse(R"({
        "nodeId": "node_x", "channels": ["internet"], "firstSeen": 10, "lastSeen": 20
    })"));
    REQUIRE(good.has_value());
    CHECK(good->last_seen_ms == 20);
    CHECK(good->relay_capable);

    CHECK_FALSE(codec::peer_from_json(json::parse(R"({ "nodeId": 7 })")).has_value());
    CHECK_FALSE(codec::peer_from_json(json::parse(R"({ "nodeId": "node_x", "channels": ["warp"] })")).has_value());
    CHECK_FALSE(codec::peer_from_json(json::parse(R"({ "channels": ["internet"] })")).has_value());
}

TEST_CASE("Log level names parse with a fallback") {
    CHECK(log::parse_level("warn", LogLevel::Info) == LogLevel::Warn);
    CHECK(log::parse_level("off", LogLevel::Info) == LogLevel::Off);
    CHECK(log::parse_level("chatty", LogLevel::Error) == LogLevel::Error);
}
