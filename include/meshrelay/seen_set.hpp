/**
 * @file seen_set.hpp
 * @brief Dedup memory and the gossip gate.
 *
 * @details
 * Every inbound frame passes here first. If its content hash is already in
 * the set, the frame is a duplicate and goes no further. If it is new, the
 * gossip gate decides whether this node re-broadcasts it.
 *
 * @par Gossip rule
 * - null frame: never
 * - emergency flag, or priority 0/1: always
 * - otherwise: `random_sample < novelty × 0.8 + 0.1` (novelty clamped to [0,1])
 *
 * The set only grows until it holds more than 10,000 hashes; past that,
 * `prune()` drops those older than an hour.
 */
#ifndef MESHRELAY_SEEN_SET_HPP
#define MESHRELAY_SEEN_SET_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include "meshrelay/constants.hpp"
#include "meshrelay/frame_codec.hpp"

namespace meshrelay {

class SeenSet {
public:
  SeenSet();

  bool seen(const std::string& hash) const;
  void mark_seen(const std::string& hash, uint64_t now_ms);

  /// Atomic check-then-insert. Returns true if the hash was already present.
  bool check_and_mark(const std::string& hash, uint64_t now_ms);

  /// Drop entries older than `retention_ms` once above `threshold`. Returns count dropped.
  size_t prune(uint64_t now_ms, size_t threshold = SEEN_PRUNE_THRESHOLD,
               uint64_t retention_ms = SEEN_RETENTION_MS);

  size_t size() const;

  bool should_gossip(const Frame* frame, double novelty, double random_sample);
  /// Same rule with a sample drawn from the set's own generator.
  bool should_gossip(const Frame* frame, double novelty);

  uint64_t duplicates() const { return duplicates_.load(); }
  uint64_t gossip_broadcasts() const { return broadcasts_.load(); }
  uint64_t gossip_suppressed() const { return suppressed_.load(); }

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> seen_;   // hash → first seen ms
  std::mt19937_64 rng_;

  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> broadcasts_{0};
  std::atomic<uint64_t> suppressed_{0};
};

} // namespace meshrelay

#endif // MESHRELAY_SEEN_SET_HPP
