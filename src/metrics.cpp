#include "meshrelay/metrics.hpp"

namespace meshrelay {

void Metrics::channel_sent(transport::Channel ch, uint64_t bytes) {
  auto& c = channels_[static_cast<size_t>(ch)];
  ++c.sent;
  c.bytes += bytes;
}

void Metrics::channel_received(transport::Channel ch, uint64_t bytes) {
  auto& c = channels_[static_cast<size_t>(ch)];
  ++c.received;
  c.bytes += bytes;
}

void Metrics::channel_relayed(transport::Channel ch) {
  ++channels_[static_cast<size_t>(ch)].relayed;
}

void Metrics::channel_error(transport::Channel ch) {
  ++channels_[static_cast<size_t>(ch)].errors;
}

MetricsSnapshot Metrics::snapshot(uint64_t deduplicated, uint64_t gossip_broadcasts,
                                  uint64_t gossip_suppressed) const {
  MetricsSnapshot s;
  s.transmissions       = transmissions.load();
  s.receptions          = receptions.load();
  s.relayed             = relayed.load();
  s.store_forward       = store_forward.load();
  s.bytes_sent          = bytes_sent.load();
  s.bytes_received      = bytes_received.load();
  s.failovers           = failovers.load();
  s.peers_discovered    = peers_discovered.load();
  s.peers_swept         = peers_swept.load();
  s.transfers_completed = transfers_completed.load();
  s.transfers_failed    = transfers_failed.load();
  s.expired             = expired.load();
  s.dropped             = dropped.load();
  s.integrity_failures  = integrity_failures.load();
  s.frames_encoded      = frames_encoded.load();
  s.frames_decoded      = frames_decoded.load();
  s.crc_errors          = crc_errors.load();
  s.beacons_emitted     = beacons_emitted.load();
  s.ticks               = ticks.load();
  s.deduplicated        = deduplicated;
  s.gossip_broadcasts   = gossip_broadcasts;
  s.gossip_suppressed   = gossip_suppressed;
  for (size_t i = 0; i < transport::CHANNEL_COUNT; ++i) {
    s.channels[i].sent     = channels_[i].sent.load();
    s.channels[i].received = channels_[i].received.load();
    s.channels[i].relayed  = channels_[i].relayed.load();
    s.channels[i].bytes    = channels_[i].bytes.load();
    s.channels[i].errors   = channels_[i].errors.load();
  }
  return s;
}

} // namespace meshrelay
