// -----------------------------------------------------------------------------
// relay_queue.cpp: store-and-forward buffer
//
// API contract, bounds and failure model: see include/meshrelay/relay_queue.hpp
//
// NOTE: entries_ is a sorted vector, not a heap. Pending counts are small
// (≤ 10,000) and drains walk the whole queue anyway; a vector keeps the order
// visible to pending() with no extra work.
// -----------------------------------------------------------------------------
#include "meshrelay/relay_queue.hpp"

#include "meshrelay/digest.hpp"
#include "meshrelay/log.hpp"

#include <algorithm>

namespace meshrelay {

namespace {

bool ranks_before(const RelayEntry& a, const RelayEntry& b) {
  if (a.priority_class != b.priority_class) return a.priority_class < b.priority_class;
  return a.order < b.order;
}

} // namespace

const char* to_string(RelayStatus s) {
  switch (s) {
    case RelayStatus::Queued:    return "queued";
    case RelayStatus::Delivered: return "delivered";
    case RelayStatus::Expired:   return "expired";
    case RelayStatus::Failed:    return "failed";
  }
  return "queued";
}

// Marker strings match the compact canonical form: "type":"THREAT", no spaces.
RelayClass classify_priority(std::string_view payload) {
  auto has = [&](std::string_view needle) { return payload.find(needle) != std::string_view::npos; };

  if (has("\"type\":\"THREAT\"") || has("\"pain_memory\""))      return RelayClass::Threat;
  if (has("\"type\":\"TRANSACTION\"") || has("\"royalt"))        return RelayClass::Economic;
  if (has("\"consciousness\"") || has("\"type\":\"ENTITY\""))     return RelayClass::Consciousness;
  if (has("\"type\":\"KNOWLEDGE\"") || has("\"type\":\"THEOREM\"")) return RelayClass::Knowledge;
  return RelayClass::General;
}

RelayConfig apply_relay_update(RelayConfig base, const RelayConfigUpdate& update) {
  if (update.enabled) base.enabled = *update.enabled;
  if (update.max_queue_size) {
    base.max_queue_size = static_cast<size_t>(std::clamp<int64_t>(
        *update.max_queue_size, RELAY_QUEUE_MIN, RELAY_QUEUE_CEILING));
  }
  if (update.max_hold_time_ms) {
    base.max_hold_time_ms = std::clamp<int64_t>(
        *update.max_hold_time_ms, RELAY_HOLD_FLOOR_MS, RELAY_HOLD_CAP_MS);
  }
  return base;
}

// ---------- public ----------

RelayQueue::RelayQueue(const RelayConfig& config) {
  RelayConfigUpdate u;
  u.enabled          = config.enabled;
  u.max_queue_size   = static_cast<int64_t>(config.max_queue_size);
  u.max_hold_time_ms = config.max_hold_time_ms;
  configure(u);
}

RelayConfig RelayQueue::configure(const RelayConfigUpdate& update) {
  std::lock_guard<std::mutex> lock(mu_);
  config_ = apply_relay_update(config_, update);
  trim_to_capacity_locked();    // a shrunk ceiling applies at once
  return config_;
}

RelayConfig RelayQueue::config() const {
  std::lock_guard<std::mutex> lock(mu_);
  return config_;
}

// -----------------------------------------------------------------------------
// enqueue()
// PRE:    packet not null; relay enabled.
// POLICY: class = option → packet → keyword shim. Full queue drops whichever
//         entry ranks last, which may be the incoming one.
// OUT:    relay id and expiry on success.
// -----------------------------------------------------------------------------
EnqueueResult RelayQueue::enqueue(const Packet* packet, std::string_view destination_id,
                                  const EnqueueOptions& options, uint64_t now_ms) {
  EnqueueResult r;
  if (!packet) {
    r.error = MeshError::MissingRequiredInput;
    return r;
  }

  RelayEntry e;
  e.id             = make_id("relay");
  e.packet         = *packet;
  e.destination_id = destination_id.empty() ? std::string(BROADCAST) : std::string(destination_id);
  if (options.priority_class)      e.priority_class = *options.priority_class;
  else if (packet->priority_class) e.priority_class = *packet->priority_class;
  else                             e.priority_class = classify_priority(packet->payload);
  e.queued_at_ms   = now_ms;
  e.max_attempts   = options.max_attempts == 0 ? RELAY_MAX_ATTEMPTS : options.max_attempts;
  e.packet.header.flags.set(MeshFlags::STORE_FORWARD);

  std::lock_guard<std::mutex> lock(mu_);
  if (!config_.enabled) {
    r.error = MeshError::RelayDisabled;
    return r;
  }

  // positive holds share the config ceiling; negative ones stand (already expired)
  const int64_t hold = std::min(options.hold_time_ms.value_or(config_.max_hold_time_ms), RELAY_HOLD_CAP_MS);
  e.expires_at_ms = static_cast<int64_t>(now_ms) + hold;
  e.order = next_order_++;

  if (entries_.size() >= config_.max_queue_size) {
    if (!entries_.empty() && !ranks_before(e, entries_.back())) {
      r.error = MeshError::QueueFull;          // incoming ranks last: it is the one dropped
      r.priority_class = e.priority_class;
      return r;
    }
    r.evicted_id = entries_.back().id;
    entries_.pop_back();
  }

  auto at = std::upper_bound(entries_.begin(), entries_.end(), e, ranks_before);
  r.queued         = true;
  r.relay_id       = e.id;
  r.priority_class = e.priority_class;
  r.expires_at_ms  = e.expires_at_ms;
  entries_.insert(at, std::move(e));
  return r;
}

// -----------------------------------------------------------------------------
// drain()
// POLICY:
//   - Expiry first, over the whole queue, no delivery attempt for expired.
//   - Then walk in priority order; unreachable entries wait untouched.
//   - A refused delivery counts an attempt; max attempts → failed, removed.
// OUT:    counts; `remaining` is the queue size afterwards.
// -----------------------------------------------------------------------------
DrainReport RelayQueue::drain(uint64_t now_ms, const Reachability& reachable, const Delivery& delivery) {
  DrainReport rep;
  const int64_t now = static_cast<int64_t>(now_ms);

  std::lock_guard<std::mutex> lock(mu_);

  auto expired_end = std::remove_if(entries_.begin(), entries_.end(),
                                    [now](const RelayEntry& e) { return e.expires_at_ms < now; });
  rep.expired = static_cast<size_t>(std::distance(expired_end, entries_.end()));
  entries_.erase(expired_end, entries_.end());

  std::vector<RelayEntry> kept;
  kept.reserve(entries_.size());
  for (auto& e : entries_) {
    const auto ch = reachable ? reachable(e.destination_id) : std::nullopt;
    if (!ch) {
      kept.push_back(std::move(e));
      continue;
    }
    const bool ok = delivery ? delivery(e, *ch) : true;
    if (ok) {
      ++rep.delivered;
      continue;
    }
    ++e.attempts;
    if (e.attempts >= e.max_attempts) {
      ++rep.failed;
      log::warn("relay", "entry " + e.id + " failed after " + std::to_string(e.attempts) + " attempts");
      continue;
    }
    kept.push_back(std::move(e));
  }
  entries_.swap(kept);      // relative order preserved

  rep.remaining = entries_.size();
  return rep;
}

std::optional<RelayEntry> RelayQueue::dequeue() {
  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.empty()) return std::nullopt;
  RelayEntry head = std::move(entries_.front());
  entries_.erase(entries_.begin());
  return head;
}

std::vector<RelayEntry> RelayQueue::pending(size_t limit) const {
  std::lock_guard<std::mutex> lock(mu_);
  const size_t n = (limit == 0) ? entries_.size() : std::min(limit, entries_.size());
  return std::vector<RelayEntry>(entries_.begin(), entries_.begin() + n);
}

bool RelayQueue::remove(const std::string& relay_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const RelayEntry& e) { return e.id == relay_id; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

size_t RelayQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

// ---------- private ----------

void RelayQueue::trim_to_capacity_locked() {
  if (entries_.size() <= config_.max_queue_size) return;
  const size_t dropped = entries_.size() - config_.max_queue_size;
  entries_.resize(config_.max_queue_size);      // tail = lowest priority, newest
  log::info("relay", "queue ceiling lowered; dropped " + std::to_string(dropped) + " entries");
}

} // namespace meshrelay
