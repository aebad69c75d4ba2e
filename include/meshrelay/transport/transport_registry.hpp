#pragma once
/**
 * @file transport_registry.hpp
 * @brief Channel availability: who can carry bytes right now.
 *
 * The registry pairs the fixed capability table (channel.hpp) with a mutable
 * "usable" flag per channel. Flags are refreshed by `probe()`, which asks a
 * platform collaborator (`IChannelProbe`) one yes/no question per channel.
 *
 * Contract:
 *  - The default probe answers yes for `internet` only. A node with no
 *    platform checks still routes over the network.
 *  - `probe()` never holds the registry lock while the collaborator runs.
 *  - `available_channels()` lists usable channels in channel-priority order
 *    (lowest number first). Routing reads this; diagnostics read
 *    `status_report()`.
 */

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "meshrelay/transport/channel.hpp"

namespace meshrelay::transport {

/**
 * @brief Platform capability check, one boolean per channel.
 */
class IChannelProbe {
public:
  virtual ~IChannelProbe() = default;
  virtual bool usable(Channel ch) const = 0;
  virtual const char* name() const = 0;
};

/// Reports only the network channel usable.
class DefaultProbe : public IChannelProbe {
public:
  bool usable(Channel ch) const override { return ch == Channel::Internet; }
  const char* name() const override { return "default"; }
};

/// Reports a fixed set; used for configured nodes and tests.
class StaticProbe : public IChannelProbe {
public:
  StaticProbe() = default;
  explicit StaticProbe(const ChannelSet& channels) : channels_(channels) {}
  bool usable(Channel ch) const override { return contains(channels_, ch); }
  const char* name() const override { return "static"; }
private:
  ChannelSet channels_;
};

struct ChannelStatus {
  const ChannelProfile*   profile{nullptr};
  bool                    available{false};
  std::optional<uint32_t> latency_ms;
};

class TransportRegistry {
public:
  TransportRegistry();
  explicit TransportRegistry(std::shared_ptr<IChannelProbe> probe);

  /// Swap the collaborator; does not re-probe.
  void set_probe(std::shared_ptr<IChannelProbe> probe);

  /// Refresh every flag from the collaborator. Returns the new flags.
  std::array<bool, CHANNEL_COUNT> probe();

  bool available(Channel ch) const;
  void set_available(Channel ch, bool usable);

  ChannelSet available_channels() const;
  bool any_available() const;

  std::vector<ChannelStatus> status_report() const;

  void set_latency_ms(Channel ch, uint32_t ms);
  std::optional<uint32_t> latency_ms(Channel ch) const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<IChannelProbe> probe_;
  std::array<bool, CHANNEL_COUNT> available_{};
  std::array<std::optional<uint32_t>, CHANNEL_COUNT> latency_{};
};

} // namespace meshrelay::transport
