// -----------------------------------------------------------------------------
// router.cpp: channel scoring and selection
//
// Scoring table and exclusions: see include/meshrelay/router.hpp
// -----------------------------------------------------------------------------
#include "meshrelay/router.hpp"

#include "meshrelay/constants.hpp"
#include "meshrelay/fragmenter.hpp"

#include <algorithm>
#include <vector>

namespace meshrelay {

using transport::Channel;
using transport::Speed;

namespace {

constexpr int SCORE_BASE            = 100;
constexpr int SCORE_PER_PRIORITY    = 10;
constexpr int BONUS_LOCAL           = 50;
constexpr int BONUS_NEARBY          = 30;
constexpr int PENALTY_OVERSIZE      = 20;
constexpr int BONUS_THREAT_HIGH     = 20;
constexpr int BONUS_THREAT_MEDIUM   = 10;
constexpr int BONUS_LOW_LATENCY     = 15;
constexpr uint32_t LOW_LATENCY_MS   = 50;
constexpr size_t MAX_ALTERNATES     = 2;

struct Scored {
  Channel channel;
  int     score;
  size_t  fragments;
  bool    oversize;
};

} // namespace

const char* to_string(Proximity p) {
  switch (p) {
    case Proximity::None:   return "none";
    case Proximity::Local:  return "local";
    case Proximity::Nearby: return "nearby";
  }
  return "none";
}

std::optional<Proximity> proximity_from_string(const std::string& s) {
  if (s == "none" || s.empty()) return Proximity::None;
  if (s == "local")  return Proximity::Local;
  if (s == "nearby") return Proximity::Nearby;
  return std::nullopt;
}

const char* to_string(RouteMode m) {
  switch (m) {
    case RouteMode::Direct:       return "direct";
    case RouteMode::Fragmented:   return "fragmented";
    case RouteMode::StoreForward: return "store_forward";
  }
  return "store_forward";
}

// -----------------------------------------------------------------------------
// select_route()
// PRE:    none; an empty registry is a normal input.
// POLICY: exclusions first, then score, then stable tie-break on priority.
// OUT:    decision with up to two alternates in score order.
// -----------------------------------------------------------------------------
RouteDecision select_route(size_t payload_bytes, const RouteOptions& options,
                           const transport::TransportRegistry& registry) {
  const bool threat = options.priority_class && *options.priority_class == RelayClass::Threat;

  std::vector<Scored> ranked;
  for (Channel ch : registry.available_channels()) {
    const auto& s = transport::profile(ch);

    // EXCLUDE: proximity-only media need the peer at hand, unless it is a threat
    if (s.proximity_only && options.proximity != Proximity::Local && !threat) continue;

    const bool oversize = payload_bytes > s.max_payload_bytes;
    const size_t frags = oversize ? fragment_count(payload_bytes, chunk_size_for(ch)) : 1;
    if (frags > FRAGMENT_TOTAL_MAX) continue;   // EXCLUDE: header cannot count that high

    int score = SCORE_BASE - s.priority * SCORE_PER_PRIORITY;
    if (options.proximity == Proximity::Local &&
        (ch == Channel::Bluetooth || ch == Channel::Nfc))          score += BONUS_LOCAL;
    if (options.proximity == Proximity::Nearby && ch == Channel::WifiDirect) score += BONUS_NEARBY;
    if (oversize)                                                  score -= PENALTY_OVERSIZE;
    if (threat && s.speed == Speed::High)                          score += BONUS_THREAT_HIGH;
    if (threat && s.speed == Speed::Medium)                        score += BONUS_THREAT_MEDIUM;
    const auto latency = registry.latency_ms(ch);
    if (latency && *latency < LOW_LATENCY_MS)                      score += BONUS_LOW_LATENCY;

    ranked.push_back(Scored{ch, score, frags, oversize});
  }

  RouteDecision d;
  if (ranked.empty()) {
    d.mode   = RouteMode::StoreForward;
    d.reason = "no_channels_available";
    return d;
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const Scored& a, const Scored& b) {
    if (a.score != b.score) return a.score > b.score;
    return transport::profile(a.channel).priority < transport::profile(b.channel).priority;
  });

  const Scored& best = ranked.front();
  d.channel             = best.channel;
  d.score               = best.score;
  d.needs_fragmentation = best.oversize;
  d.fragment_count      = best.fragments;
  d.mode                = best.oversize ? RouteMode::Fragmented : RouteMode::Direct;
  d.reason              = std::string("optimal_route_") + transport::to_string(best.channel);
  for (size_t i = 1; i < ranked.size() && d.alternates.size() < MAX_ALTERNATES; ++i) {
    d.alternates.push_back(ranked[i].channel);
  }
  return d;
}

} // namespace meshrelay
