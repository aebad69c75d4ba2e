/**
 * @file config.hpp
 * @brief Operator configuration for one mesh runtime.
 *
 * @details
 * Loaded from a small JSON file, by default
 * `$XDG_CONFIG_HOME/meshrelay/config.json` (`~/.config/meshrelay/config.json`).
 *
 * @code{.json}
 * {
 *   "nodeId": "node_4f2b000131aa00ff1c2d",
 *   "relay": { "enabled": true, "maxQueueSize": 1000, "holdTimeMs": 86400000 },
 *   "stalePeerWindowMs": 7200000,
 *   "transferRetentionMs": 3600000,
 *   "channels": ["internet", "bluetooth"],
 *   "logLevel": "info",
 *   "peersFile": "/var/lib/meshrelay/peers.json"
 * }
 * @endcode
 *
 * Every key is optional. Unknown keys are ignored, wrong types fall back to
 * the default (with a warning), and relay limits are clamped exactly as
 * `RelayQueue::configure()` clamps them. `maxHoldTimeMs` is accepted as an
 * alias of `holdTimeMs`. A missing `channels` key means "use the default
 * probe" (internet only).
 */
#ifndef MESHRELAY_CONFIG_HPP
#define MESHRELAY_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "meshrelay/constants.hpp"
#include "meshrelay/log.hpp"
#include "meshrelay/relay_queue.hpp"
#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

struct MeshConfig {
  std::string                          node_id;
  RelayConfig                          relay;
  uint64_t                             stale_peer_window_ms{STALE_PEER_WINDOW_MS};
  uint64_t                             transfer_retention_ms{TRANSFER_RETENTION_MS};
  std::optional<transport::ChannelSet> channels;
  LogLevel                             log_level{LogLevel::Info};
  std::string                          peers_file;
};

namespace config {

/// `$XDG_CONFIG_HOME/meshrelay`, else `$HOME/.config/meshrelay`.
std::filesystem::path default_dir();

/// Never throws; bad values are reported and replaced by defaults.
MeshConfig from_json(const nlohmann::json& j);
nlohmann::json to_json(const MeshConfig& cfg);

/// Missing file → defaults and `found == false`. Unreadable JSON → defaults and a warning.
MeshConfig load(const std::filesystem::path& file, bool* found = nullptr);
bool save(const std::filesystem::path& file, const MeshConfig& cfg);

} // namespace config
} // namespace meshrelay

#endif // MESHRELAY_CONFIG_HPP
