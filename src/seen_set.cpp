// -----------------------------------------------------------------------------
// seen_set.cpp: dedup membership and gossip decision
// -----------------------------------------------------------------------------
#include "meshrelay/seen_set.hpp"

#include "meshrelay/log.hpp"

#include <algorithm>

namespace meshrelay {

SeenSet::SeenSet() : rng_(std::random_device{}()) {}

bool SeenSet::seen(const std::string& hash) const {
  std::lock_guard<std::mutex> lock(mu_);
  return seen_.count(hash) != 0;
}

void SeenSet::mark_seen(const std::string& hash, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  seen_.emplace(hash, now_ms);        // first sighting wins; re-marks keep the old stamp
}

bool SeenSet::check_and_mark(const std::string& hash, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  const bool inserted = seen_.emplace(hash, now_ms).second;
  if (!inserted) ++duplicates_;
  return !inserted;
}

size_t SeenSet::prune(uint64_t now_ms, size_t threshold, uint64_t retention_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  if (seen_.size() <= threshold) return 0;
  size_t dropped = 0;
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (now_ms > it->second && now_ms - it->second > retention_ms) {
      it = seen_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  if (dropped) log::debug("dedup", "pruned " + std::to_string(dropped) + " hashes");
  return dropped;
}

size_t SeenSet::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return seen_.size();
}

// -----------------------------------------------------------------------------
// should_gossip()
// POLICY: urgent frames always propagate; the rest propagate with probability
//         novelty×0.8 + 0.1, so even stale news has a 10% floor.
// -----------------------------------------------------------------------------
bool SeenSet::should_gossip(const Frame* frame, double novelty, double random_sample) {
  if (!frame) return false;

  bool go = false;
  if (frame->flags.emergency() || frame->priority <= Urgency::Threat) {
    go = true;
  } else {
    const double n = std::clamp(novelty, 0.0, 1.0);
    go = random_sample < n * GOSSIP_NOVELTY_WEIGHT + GOSSIP_BASE_RATE;
  }

  if (go) ++broadcasts_;
  else    ++suppressed_;
  return go;
}

bool SeenSet::should_gossip(const Frame* frame, double novelty) {
  double sample = 0.0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    sample = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
  }
  return should_gossip(frame, novelty, sample);
}

} // namespace meshrelay
