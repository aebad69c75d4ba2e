// ============================================================================
// peer_directory.cpp: implementation for peer_directory.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "meshrelay/peer_directory.hpp"
#include "meshrelay/json_codec.hpp"   // codec::to_json(Peer), peer_from_json, file helpers
#include "meshrelay/log.hpp"

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;
namespace meshrelay {

// -------- helpers --------

// Snapshot file layout:
//   { "selfId": "...", "peers": [ {peer}, ... ] }
// selfId is informational; load() never adopts it.
static constexpr const char* SNAPSHOT_PEERS_KEY = "peers";

// -------- public API --------

PeerDirectory::PeerDirectory(std::string self_id) : self_id_(std::move(self_id)) {}

void PeerDirectory::set_self_id(std::string self_id) {
  std::lock_guard<std::mutex> lock(mu_);
  self_id_ = std::move(self_id);
  peers_.erase(self_id_);          // never our own peer, even retroactively
}

std::string PeerDirectory::self_id() const {
  std::lock_guard<std::mutex> lock(mu_);
  return self_id_;
}

/*
 * register_peer()
 * ---------------
 * First sighting creates; later sightings refresh.
 *
 * Refresh rules:
 * - channels grow by union, never shrink
 * - first_seen stays put, last_seen moves to now
 * - version / latency / relay flag only change when the sighting carries them
 */
std::optional<Peer> PeerDirectory::register_peer(const PeerInfo* info, uint64_t now_ms, bool* created) {
  if (created) *created = false;
  if (!info || info->node_id.empty()) return std::nullopt;

  std::lock_guard<std::mutex> lock(mu_);
  if (info->node_id == self_id_) return std::nullopt;

  auto it = peers_.find(info->node_id);
  if (it == peers_.end()) {
    Peer p;
    p.node_id          = info->node_id;
    p.relay_capable    = info->relay_capable.value_or(true);
    p.discovery_method = info->discovery_method.empty() ? "direct" : info->discovery_method;
    p.version          = info->version;
    p.latency_ms       = info->latency_ms;
    p.first_seen_ms    = now_ms;
    p.last_seen_ms     = now_ms;
    for (auto ch : info->channels) transport::insert_unique(p.channels, ch);
    it = peers_.emplace(p.node_id, std::move(p)).first;
    if (created) *created = true;
    log::debug("peers", "discovered " + info->node_id);
    return it->second;
  }

  Peer& p = it->second;
  for (auto ch : info->channels) transport::insert_unique(p.channels, ch);
  if (info->relay_capable) p.relay_capable = *info->relay_capable;
  if (!info->version.empty()) p.version = info->version;
  if (info->latency_ms) p.latency_ms = info->latency_ms;
  if (now_ms > p.last_seen_ms) p.last_seen_ms = now_ms;
  return p;
}

std::optional<Peer> PeerDirectory::register_peer(const PeerInfo& info, uint64_t now_ms, bool* created) {
  return register_peer(&info, now_ms, created);
}

bool PeerDirectory::remove_peer(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return peers_.erase(node_id) > 0;
}

std::optional<Peer> PeerDirectory::find(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = peers_.find(node_id);
  if (it == peers_.end()) return std::nullopt;
  return it->second;
}

bool PeerDirectory::contains(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return peers_.count(node_id) > 0;
}

size_t PeerDirectory::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return peers_.size();
}

std::vector<Peer> PeerDirectory::peers(size_t limit) const {
  std::vector<Peer> out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    out.reserve(peers_.size());
    for (const auto& kv : peers_) out.push_back(kv.second);
  }
  // stable: equal timestamps keep id order from the map
  std::stable_sort(out.begin(), out.end(), [](const Peer& a, const Peer& b) {
    return a.last_seen_ms > b.last_seen_ms;
  });
  if (limit != 0 && out.size() > limit) out.resize(limit);
  return out;
}

Topology PeerDirectory::topology(const transport::ChannelSet& active_channels) const {
  Topology t;
  t.self_id         = self_id();
  t.nodes           = peers();
  t.total_nodes     = t.nodes.size() + 1;
  t.active_channels = active_channels;
  return t;
}

bool PeerDirectory::record_transmission(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = peers_.find(node_id);
  if (it == peers_.end()) return false;
  ++it->second.transmissions;
  return true;
}

size_t PeerDirectory::sweep_stale(uint64_t now_ms, uint64_t window_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  size_t removed = 0;
  for (auto it = peers_.begin(); it != peers_.end();) {
    const uint64_t last = it->second.last_seen_ms;
    // a clock that went backwards never sweeps
    if (now_ms > last && now_ms - last > window_ms) {
      log::info("peers", "sweeping stale peer " + it->first);
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

/*
 * save()
 * ------
 * Serialize the roster and write it atomically (temp file + rename).
 */
bool PeerDirectory::save(const fs::path& file) const {
  nlohmann::json j;
  j["selfId"] = self_id();
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& p : peers()) arr.push_back(codec::to_json(p));
  j[SNAPSHOT_PEERS_KEY] = arr;
  return codec::atomic_write_json(file, j);
}

/*
 * load()
 * ------
 * Merge a snapshot into the live roster. A record that fails to parse is
 * skipped with a warning; the rest still load. Existing peers win over the
 * snapshot on conflict, except that channels are unioned.
 */
size_t PeerDirectory::load(const fs::path& file) {
  const nlohmann::json j = codec::read_json_file(file);
  auto it = j.find(SNAPSHOT_PEERS_KEY);
  if (it == j.end()) return 0;
  if (!it->is_array()) {
    log::warn("peers", "snapshot " + file.string() + " has no peer list");
    return 0;
  }

  size_t restored = 0;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& rec : *it) {
    auto p = codec::peer_from_json(rec);
    if (!p) {
      log::warn("peers", "skipping malformed peer record in " + file.string());
      continue;
    }
    if (p->node_id == self_id_) continue;

    auto existing = peers_.find(p->node_id);
    if (existing == peers_.end()) {
      peers_.emplace(p->node_id, std::move(*p));
    } else {
      for (auto ch : p->channels) transport::insert_unique(existing->second.channels, ch);
    }
    ++restored;
  }
  return restored;
}

} // namespace meshrelay
