#pragma once
/**
 * @file metrics.hpp
 * @brief Monotonic counters for the relay: what went out, what came in, what was lost.
 *
 * Counters only ever go up. Read them any time with `snapshot()`; the copy is
 * per-field consistent (each load is atomic), not a global freeze.
 */

#include <array>
#include <atomic>
#include <cstdint>

#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

/** @struct ChannelStats
 *  @brief Per-channel traffic, plain values.
 */
struct ChannelStats {
  uint64_t sent{0};
  uint64_t received{0};
  uint64_t relayed{0};
  uint64_t bytes{0};
  uint64_t errors{0};
};

/** @struct MetricsSnapshot
 *  @brief Point-in-time copy of every counter.
 */
struct MetricsSnapshot {
  uint64_t transmissions{0};        ///< successful direct/fragmented sends
  uint64_t receptions{0};           ///< verified receives
  uint64_t relayed{0};              ///< relay entries delivered by drain
  uint64_t store_forward{0};        ///< packets parked in the relay queue
  uint64_t bytes_sent{0};
  uint64_t bytes_received{0};
  uint64_t failovers{0};            ///< first-choice channel refused a send
  uint64_t peers_discovered{0};
  uint64_t peers_swept{0};
  uint64_t transfers_completed{0};
  uint64_t transfers_failed{0};
  uint64_t expired{0};              ///< relay entries past their hold time
  uint64_t dropped{0};              ///< relay entries refused, evicted or failed
  uint64_t integrity_failures{0};
  uint64_t frames_encoded{0};
  uint64_t frames_decoded{0};
  uint64_t crc_errors{0};
  uint64_t deduplicated{0};
  uint64_t gossip_broadcasts{0};
  uint64_t gossip_suppressed{0};
  uint64_t beacons_emitted{0};
  uint64_t ticks{0};
  std::array<ChannelStats, transport::CHANNEL_COUNT> channels{};
};

class Metrics {
public:
  std::atomic<uint64_t> transmissions{0};
  std::atomic<uint64_t> receptions{0};
  std::atomic<uint64_t> relayed{0};
  std::atomic<uint64_t> store_forward{0};
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> failovers{0};
  std::atomic<uint64_t> peers_discovered{0};
  std::atomic<uint64_t> peers_swept{0};
  std::atomic<uint64_t> transfers_completed{0};
  std::atomic<uint64_t> transfers_failed{0};
  std::atomic<uint64_t> expired{0};
  std::atomic<uint64_t> dropped{0};
  std::atomic<uint64_t> integrity_failures{0};
  std::atomic<uint64_t> frames_encoded{0};
  std::atomic<uint64_t> frames_decoded{0};
  std::atomic<uint64_t> crc_errors{0};
  std::atomic<uint64_t> beacons_emitted{0};
  std::atomic<uint64_t> ticks{0};

  void channel_sent(transport::Channel ch, uint64_t bytes);
  void channel_received(transport::Channel ch, uint64_t bytes);
  void channel_relayed(transport::Channel ch);
  void channel_error(transport::Channel ch);

  /// Gossip and dedup counters live in SeenSet; the runtime passes them in.
  MetricsSnapshot snapshot(uint64_t deduplicated = 0, uint64_t gossip_broadcasts = 0,
                           uint64_t gossip_suppressed = 0) const;

private:
  struct ChannelCounters {
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> relayed{0};
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> errors{0};
  };
  std::array<ChannelCounters, transport::CHANNEL_COUNT> channels_{};
};

} // namespace meshrelay
