/**
 * @file relay_queue.hpp
 * @brief Store-and-forward buffer: priority ordered, bounded, expiring.
 *
 * @details
 * ## Field Brief
 * When no live channel reaches a destination, the packet is parked here. The
 * heartbeat drains the queue every tick: what can be delivered goes, what
 * has outlived its hold time is counted and dropped, the rest waits.
 *
 * ---
 *
 * @par Ordering
 * Entries are kept sorted by priority class (1 = threat first, 5 = general
 * last), FIFO within a class. `drain()` and `dequeue()` walk that order, so
 * a threat entry never leaves after a general entry queued before it.
 *
 * @par Bounds
 * | Knob               | Range                   | Default |
 * |--------------------|-------------------------|---------|
 * | `max_queue_size`   | 10 … 10,000             | 1,000   |
 * | `max_hold_time_ms` | 60,000 … 7 days         | 24 h    |
 *
 * `configure()` clamps into those ranges. The floor stops an operator from
 * configuring instant expiry. A per-entry `hold_time_ms` passed to
 * `enqueue()` skips the floor, so zero or negative holds stand, but it is
 * still capped at 7 days.
 *
 * @par Full queue
 * The entry that ranks last (lowest priority, newest) is the one dropped. If
 * that is the incoming entry, `enqueue()` returns `queue_full`; otherwise the
 * old tail is evicted to make room.
 *
 * @par Failure Model
 * - expired entry → removed before any delivery attempt, counted `expired`
 * - delivery refused → `attempts++`; at `max_attempts` the entry is `failed`
 * - destination unreachable → entry stays, no attempt counted
 *
 * @par Concurrency
 * One mutex, held for the whole of each call including `drain()` callbacks.
 * Callbacks must not call back into the queue.
 */
#ifndef MESHRELAY_RELAY_QUEUE_HPP
#define MESHRELAY_RELAY_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "meshrelay/constants.hpp"
#include "meshrelay/error.hpp"
#include "meshrelay/packet.hpp"
#include "meshrelay/transport/channel.hpp"
#include "meshrelay/urgency.hpp"

namespace meshrelay {

enum class RelayStatus : uint8_t { Queued, Delivered, Expired, Failed };
const char* to_string(RelayStatus s);

struct RelayEntry {
  std::string  id;
  Packet       packet;
  std::string  destination_id;
  RelayClass   priority_class{RelayClass::General};
  uint64_t     queued_at_ms{0};
  int64_t      expires_at_ms{0};
  uint32_t     attempts{0};
  uint32_t     max_attempts{RELAY_MAX_ATTEMPTS};
  RelayStatus  status{RelayStatus::Queued};
  uint64_t     order{0};          ///< insertion stamp; FIFO tie-break
};

struct RelayConfig {
  bool    enabled{true};
  size_t  max_queue_size{RELAY_QUEUE_DEFAULT};
  int64_t max_hold_time_ms{RELAY_HOLD_DEFAULT_MS};
};

/// Unset fields keep their current value.
struct RelayConfigUpdate {
  std::optional<bool>    enabled;
  std::optional<int64_t> max_queue_size;
  std::optional<int64_t> max_hold_time_ms;
};

struct EnqueueOptions {
  std::optional<int64_t>    hold_time_ms;
  std::optional<RelayClass> priority_class;
  uint32_t                  max_attempts{RELAY_MAX_ATTEMPTS};
};

struct EnqueueResult {
  bool        queued{false};
  MeshError   error{MeshError::None};
  std::string relay_id;
  RelayClass  priority_class{RelayClass::General};
  int64_t     expires_at_ms{0};
  std::string evicted_id;         ///< non-empty when an old entry made room
};

struct DrainReport {
  size_t delivered{0};
  size_t remaining{0};
  size_t expired{0};
  size_t failed{0};
};

/// Apply an update with the queue's clamps; no queue needed.
RelayConfig apply_relay_update(RelayConfig base, const RelayConfigUpdate& update);

/// Keyword shim for packets built without an explicit class.
RelayClass classify_priority(std::string_view payload);

class RelayQueue {
public:
  /// Channel to reach a destination on, or nullopt if unreachable right now.
  using Reachability = std::function<std::optional<transport::Channel>(const std::string& destination_id)>;
  /// Hand one entry to a channel; false means "try again later".
  using Delivery     = std::function<bool(const RelayEntry& entry, transport::Channel ch)>;

  explicit RelayQueue(const RelayConfig& config = {});

  /// Clamp and apply; returns the effective config.
  RelayConfig configure(const RelayConfigUpdate& update);
  RelayConfig config() const;

  EnqueueResult enqueue(const Packet* packet, std::string_view destination_id,
                        const EnqueueOptions& options, uint64_t now_ms);

  /// Expire, then deliver what is reachable. `delivery` empty → always succeeds.
  DrainReport drain(uint64_t now_ms, const Reachability& reachable, const Delivery& delivery = {});

  /// Pop the head entry (highest priority, oldest).
  std::optional<RelayEntry> dequeue();

  /// Snapshot in dequeue order; `limit == 0` means all.
  std::vector<RelayEntry> pending(size_t limit = 0) const;

  bool remove(const std::string& relay_id);
  size_t size() const;

private:
  void trim_to_capacity_locked();

  mutable std::mutex mu_;
  RelayConfig config_;
  std::vector<RelayEntry> entries_;  // sorted by (priority_class, order)
  uint64_t next_order_{0};
};

} // namespace meshrelay

#endif // MESHRELAY_RELAY_QUEUE_HPP
