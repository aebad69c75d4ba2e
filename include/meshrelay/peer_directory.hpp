#pragma once
/**
 * @file peer_directory.hpp
 * @brief Roster of remote nodes this node has heard from.
 *
 * @details
 * PURPOSE
 * -------
 * The relay queue can only hand a packet to someone it knows. The peer
 * directory is that "someone": every remote node we have sighted, which
 * channels it was reachable on, whether it will relay for others, and when
 * we last heard from it.
 *
 * WHAT THIS DOES
 * --------------
 * - `register_peer()` creates a peer on first sighting and refreshes it on
 *   every later one. Channel lists grow by union. `first_seen` never moves.
 * - Refuses empty ids and refuses our own id. A node is never its own peer.
 * - `sweep_stale()` drops peers silent for longer than a window (the
 *   heartbeat runs it every 50th tick).
 * - `save()` / `load()` keep the roster across restarts as a small JSON file
 *   (written to a temp file then renamed, so a crash never leaves half a file).
 *
 * CONCURRENCY
 * -----------
 * One mutex, scoped to this directory. Foreground sends and the heartbeat
 * can both read and mutate it; every public call is atomic on its own.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshrelay::PeerDirectory peers("node_self");
 *   meshrelay::PeerInfo info;
 *   info.node_id = "node_remote";
 *   info.channels.push_back(meshrelay::transport::Channel::Internet);
 *   auto p = peers.register_peer(info, now_ms);   // std::optional<Peer>
 * @endcode
 */

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

/**
 * @struct PeerInfo
 * @brief What a sighting tells us. Unset optionals leave existing values alone.
 */
struct PeerInfo {
  std::string               node_id;
  transport::ChannelSet     channels;
  std::optional<bool>       relay_capable;
  std::string               discovery_method;   ///< e.g. "beacon", "direct"; empty → "direct"
  std::string               version;
  std::optional<uint32_t>   latency_ms;
};

struct Peer {
  std::string             node_id;
  transport::ChannelSet   channels;
  bool                    relay_capable{true};
  std::string             discovery_method{"direct"};
  std::string             version;
  std::optional<uint32_t> latency_ms;
  uint64_t                transmissions{0};
  uint64_t                first_seen_ms{0};
  uint64_t                last_seen_ms{0};
};

struct Topology {
  std::string           self_id;
  std::vector<Peer>     nodes;
  size_t                total_nodes{1};     ///< peers + self
  transport::ChannelSet active_channels;
};

class PeerDirectory {
public:
  explicit PeerDirectory(std::string self_id);

  void set_self_id(std::string self_id);
  std::string self_id() const;

  /**
   * @brief Create or refresh a peer.
   * @param created set to true when this call created the entry
   * @return the peer after the update, or std::nullopt for null/empty/self
   */
  std::optional<Peer> register_peer(const PeerInfo* info, uint64_t now_ms, bool* created = nullptr);
  std::optional<Peer> register_peer(const PeerInfo& info, uint64_t now_ms, bool* created = nullptr);

  bool remove_peer(const std::string& node_id);

  std::optional<Peer> find(const std::string& node_id) const;
  bool contains(const std::string& node_id) const;
  size_t size() const;

  /// Most recently seen first; `limit == 0` means all.
  std::vector<Peer> peers(size_t limit = 0) const;

  Topology topology(const transport::ChannelSet& active_channels) const;

  /// Bump the transmission counter; false if unknown.
  bool record_transmission(const std::string& node_id);

  /// Remove peers with `now − last_seen > window`. Returns how many went.
  size_t sweep_stale(uint64_t now_ms, uint64_t window_ms);

  bool save(const std::filesystem::path& file) const;

  /// Merge peers from a snapshot. Returns the number restored; 0 on any error.
  size_t load(const std::filesystem::path& file);

private:
  mutable std::mutex mu_;
  std::string self_id_;
  std::map<std::string, Peer> peers_;
};

} // namespace meshrelay
