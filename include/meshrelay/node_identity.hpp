/**
 * @file node_identity.hpp
 * @brief Who this node is, and how it announces itself.
 *
 * @details
 * `self_id()` is `node_` plus 20 hex characters from the system CSPRNG,
 * derived on first use and then fixed for the life of the object. Tools
 * that want the same id across restarts pin it (config `nodeId`, or the
 * CLI state file).
 *
 * `presence_beacon()` is rebuilt on every call from whatever the caller says
 * is true right now: active channels, relay on/off, queue depth.
 */
#ifndef MESHRELAY_NODE_IDENTITY_HPP
#define MESHRELAY_NODE_IDENTITY_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

struct PresenceBeacon {
  std::string           node_id;
  uint64_t              timestamp_ms{0};
  transport::ChannelSet active_channels;
  bool                  relay_capable{false};
  size_t                pending_count{0};
  std::string           protocol_version;
};

class NodeIdentity {
public:
  NodeIdentity() = default;
  /// Pin an id; empty means "derive one".
  explicit NodeIdentity(std::string pinned_id);

  const std::string& self_id() const;

  PresenceBeacon presence_beacon(uint64_t now_ms, const transport::ChannelSet& active,
                                 bool relay_capable, size_t pending_count) const;

  /// `node_` followed by at least one character from [0-9a-zA-Z_-].
  static bool looks_like_node_id(const std::string& id);

private:
  mutable std::once_flag once_;
  mutable std::string id_;
};

} // namespace meshrelay

#endif // MESHRELAY_NODE_IDENTITY_HPP
