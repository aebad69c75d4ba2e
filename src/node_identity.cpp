#include "meshrelay/node_identity.hpp"

#include "meshrelay/constants.hpp"
#include "meshrelay/digest.hpp"
#include "meshrelay/log.hpp"

namespace meshrelay {

NodeIdentity::NodeIdentity(std::string pinned_id) : id_(std::move(pinned_id)) {
  if (!id_.empty() && !looks_like_node_id(id_)) {
    log::warn("identity", "pinned id '" + id_ + "' does not follow the node_ convention");
  }
}

// Derived once; call_once makes concurrent first calls agree on one id.
const std::string& NodeIdentity::self_id() const {
  std::call_once(once_, [this] {
    if (id_.empty()) {
      id_ = make_id("node");
      log::info("identity", "derived node id " + id_);
    }
  });
  return id_;
}

PresenceBeacon NodeIdentity::presence_beacon(uint64_t now_ms, const transport::ChannelSet& active,
                                             bool relay_capable, size_t pending_count) const {
  PresenceBeacon b;
  b.node_id          = self_id();
  b.timestamp_ms     = now_ms;
  b.active_channels  = active;
  b.relay_capable    = relay_capable;
  b.pending_count    = pending_count;
  b.protocol_version = PROTOCOL_VERSION;
  return b;
}

bool NodeIdentity::looks_like_node_id(const std::string& id) {
  static const std::string PREFIX = "node_";
  if (id.size() <= PREFIX.size() || id.compare(0, PREFIX.size(), PREFIX) != 0) return false;
  for (size_t i = PREFIX.size(); i < id.size(); ++i) {
    const char c = id[i];
    const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                    (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

} // namespace meshrelay
