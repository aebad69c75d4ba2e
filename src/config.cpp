// -----------------------------------------------------------------------------
// config.cpp: MeshConfig <-> JSON, file load/save
// -----------------------------------------------------------------------------
#include "meshrelay/config.hpp"

#include "meshrelay/json_codec.hpp"

#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace meshrelay {
namespace config {

namespace {

// Typed read with fallback; wrong type → warning, default kept.
template <typename T>
void read_field(const json& j, const char* key, T& out, bool (json::*is_type)() const noexcept) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!((*it).*is_type)()) {
    log::warn("config", std::string("ignoring '") + key + "': wrong type");
    return;
  }
  out = it->get<T>();
}

} // namespace

fs::path default_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : ".") / ".config";
  return base / "meshrelay";
}

// -----------------------------------------------------------------------------
// from_json()
// POLICY: best effort. Each key is independent; one bad key never discards
//         the rest. Relay limits clamp through RelayQueue's own rules.
// -----------------------------------------------------------------------------
MeshConfig from_json(const json& j) {
  MeshConfig cfg;
  if (!j.is_object()) {
    if (!j.is_null()) log::warn("config", "top level is not an object; using defaults");
    return cfg;
  }

  read_field(j, "nodeId", cfg.node_id, &json::is_string);
  read_field(j, "peersFile", cfg.peers_file, &json::is_string);
  read_field(j, "stalePeerWindowMs", cfg.stale_peer_window_ms, &json::is_number_unsigned);
  read_field(j, "transferRetentionMs", cfg.transfer_retention_ms, &json::is_number_unsigned);

  std::string level;
  read_field(j, "logLevel", level, &json::is_string);
  if (!level.empty()) cfg.log_level = log::parse_level(level, cfg.log_level);

  if (auto it = j.find("relay"); it != j.end() && it->is_object()) {
    RelayConfigUpdate u;
    bool enabled = cfg.relay.enabled;
    int64_t size = static_cast<int64_t>(cfg.relay.max_queue_size);
    int64_t hold = cfg.relay.max_hold_time_ms;
    read_field(*it, "enabled", enabled, &json::is_boolean);
    read_field(*it, "maxQueueSize", size, &json::is_number_integer);
    read_field(*it, "maxHoldTimeMs", hold, &json::is_number_integer);
    read_field(*it, "holdTimeMs", hold, &json::is_number_integer);
    u.enabled = enabled;
    u.max_queue_size = size;
    u.max_hold_time_ms = hold;
    cfg.relay = apply_relay_update(cfg.relay, u);   // same clamps as runtime reconfiguration
  }

  if (auto it = j.find("channels"); it != j.end()) {
    auto set = codec::channels_from_json(*it);
    if (set) cfg.channels = *set;
    else     log::warn("config", "ignoring 'channels': expected an array of channel keys");
  }
  return cfg;
}

json to_json(const MeshConfig& cfg) {
  json j;
  if (!cfg.node_id.empty()) j["nodeId"] = cfg.node_id;
  j["relay"] = {
    {"enabled", cfg.relay.enabled},
    {"maxQueueSize", cfg.relay.max_queue_size},
    {"holdTimeMs", cfg.relay.max_hold_time_ms},
  };
  j["stalePeerWindowMs"] = cfg.stale_peer_window_ms;
  j["transferRetentionMs"] = cfg.transfer_retention_ms;
  if (cfg.channels) j["channels"] = codec::to_json(*cfg.channels);
  switch (cfg.log_level) {
    case LogLevel::Debug: j["logLevel"] = "debug"; break;
    case LogLevel::Info:  j["logLevel"] = "info";  break;
    case LogLevel::Warn:  j["logLevel"] = "warn";  break;
    case LogLevel::Error: j["logLevel"] = "error"; break;
    case LogLevel::Off:   j["logLevel"] = "off";   break;
  }
  if (!cfg.peers_file.empty()) j["peersFile"] = cfg.peers_file;
  return j;
}

MeshConfig load(const fs::path& file, bool* found) {
  std::error_code ec;
  const bool exists = fs::exists(file, ec);
  if (found) *found = exists && !ec;
  if (!exists || ec) return MeshConfig{};
  return from_json(codec::read_json_file(file));
}

bool save(const fs::path& file, const MeshConfig& cfg) {
  return codec::atomic_write_json(file, to_json(cfg));
}

} // namespace config
} // namespace meshrelay
