#pragma once
/**
 * @file channel.hpp
 * @brief The seven channel kinds and their fixed capability profiles.
 *
 * Channels are descriptors, not drivers. A profile says what a medium can
 * carry; whether it is reachable right now is the registry's business.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "etl/vector.h"

namespace meshrelay::transport {

enum class Channel : uint8_t {
  Internet   = 0,
  WifiDirect = 1,
  Bluetooth  = 2,
  Lora       = 3,
  RfPacket   = 4,
  Telephone  = 5,
  Nfc        = 6
};

static constexpr size_t CHANNEL_COUNT = 7;

enum class Speed : uint8_t { Instant, High, Medium, Low, VeryLow };
enum class Bandwidth : uint8_t { High, LowMedium, Low, VeryLow };

struct ChannelProfile {
  Channel     channel;
  const char* key;            // wire/config name, e.g. "wifi_direct"
  const char* name;           // display name
  const char* protocol;
  const char* range;
  Speed       speed;
  Bandwidth   bandwidth;
  int         priority;       // lower is preferred
  size_t      max_payload_bytes;
  bool        requires_hardware;
  bool        requires_infrastructure;
  bool        proximity_only; // needs the peer physically at hand
};

/// Bounded set of channels; never more than one of each kind.
using ChannelSet = etl::vector<Channel, CHANNEL_COUNT>;

const ChannelProfile& profile(Channel ch);
const ChannelProfile* all_profiles();  // CHANNEL_COUNT entries, enum order

const char* to_string(Channel ch);
std::optional<Channel> channel_from_string(std::string_view key);
const char* to_string(Speed s);
const char* to_string(Bandwidth b);

bool contains(const ChannelSet& set, Channel ch);
/// Add `ch` unless already present.
void insert_unique(ChannelSet& set, Channel ch);

} // namespace meshrelay::transport
