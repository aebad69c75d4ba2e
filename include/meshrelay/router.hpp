/**
 * @file router.hpp
 * @brief Pick a channel for a payload, or say "store it".
 *
 * @details
 * Routing is total: it always returns a decision. No usable channel means
 * `mode == StoreForward` with no channel, never an error.
 *
 * @par Scoring (higher wins, ties → lower channel priority)
 * - base `100 − priority × 10`, so absent hints the lowest priority number wins
 * - proximity `Local`: bluetooth and nfc +50
 * - proximity `Nearby`: wifi_direct +30
 * - payload above the channel's max payload: −20 (still routable, fragmented)
 * - THREAT class: high-speed channel +20, medium-speed +10
 * - measured latency below 50 ms: +15
 *
 * @par Exclusions
 * - a channel that would need more than 255 fragments (header limit)
 * - proximity-only channels (nfc) for ordinary traffic, unless the hint is
 *   `Local`; THREAT traffic may always use them
 */
#ifndef MESHRELAY_ROUTER_HPP
#define MESHRELAY_ROUTER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "meshrelay/transport/channel.hpp"
#include "meshrelay/transport/transport_registry.hpp"
#include "meshrelay/urgency.hpp"

namespace meshrelay {

enum class Proximity : uint8_t { None, Local, Nearby };
enum class RouteMode : uint8_t { Direct, Fragmented, StoreForward };

const char* to_string(Proximity p);
std::optional<Proximity> proximity_from_string(const std::string& s);
const char* to_string(RouteMode m);

struct RouteOptions {
  Proximity                 proximity{Proximity::None};
  std::optional<RelayClass> priority_class;
};

struct RouteDecision {
  std::optional<transport::Channel> channel;
  RouteMode             mode{RouteMode::StoreForward};
  bool                  needs_fragmentation{false};
  size_t                fragment_count{0};
  int                   score{0};
  transport::ChannelSet alternates;   ///< next best, at most two
  std::string           reason;
};

RouteDecision select_route(size_t payload_bytes, const RouteOptions& options,
                           const transport::TransportRegistry& registry);

} // namespace meshrelay

#endif // MESHRELAY_ROUTER_HPP
