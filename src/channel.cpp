// -----------------------------------------------------------------------------
// channel.cpp: fixed capability table
//
// Order of PROFILES matches the Channel enum; profile(ch) indexes straight into it.
// -----------------------------------------------------------------------------
#include "meshrelay/transport/channel.hpp"

namespace meshrelay::transport {

namespace {

constexpr size_t KiB = 1024;
constexpr size_t MiB = 1024 * 1024;

const ChannelProfile PROFILES[CHANNEL_COUNT] = {
  { Channel::Internet,   "internet",    "Internet (TCP/IP)",     "HTTPS/WSS over TCP/IP",      "global",
    Speed::High,    Bandwidth::High,      3, 10 * MiB, false, true,  false },
  { Channel::WifiDirect, "wifi_direct", "WiFi Direct",           "mDNS discovery + direct TCP", "~100 meters",
    Speed::High,    Bandwidth::High,      2, 10 * MiB, false, false, false },
  { Channel::Bluetooth,  "bluetooth",   "Bluetooth / BLE",       "RFCOMM or BLE GATT",          "~10-30 meters",
    Speed::Medium,  Bandwidth::LowMedium, 1, 512 * KiB, false, false, false },
  { Channel::Lora,       "lora",        "LoRa / Mesh Radio",     "LoRa (SX127x/SX126x)",        "2-15 km",
    Speed::Low,     Bandwidth::VeryLow,   4, 242,      true,  false, false },
  { Channel::RfPacket,   "rf_packet",   "RF / Ham Packet Radio", "AX.25 packet radio or JS8Call", "regional (HF/VHF)",
    Speed::VeryLow, Bandwidth::VeryLow,   5, 256,      true,  false, false },
  { Channel::Telephone,  "telephone",   "Telephone / Landline",  "V.92 modem",                  "global (PSTN)",
    Speed::Low,     Bandwidth::Low,       6, 64 * KiB, true,  true,  false },
  { Channel::Nfc,        "nfc",         "NFC / Physical Exchange", "NFC NDEF",                  "~4 centimeters",
    Speed::Instant, Bandwidth::VeryLow,   7, 8 * KiB,  false, false, true  },
};

} // namespace

const ChannelProfile& profile(Channel ch) {
  return PROFILES[static_cast<size_t>(ch)];
}

const ChannelProfile* all_profiles() {
  return PROFILES;
}

const char* to_string(Channel ch) {
  return profile(ch).key;
}

std::optional<Channel> channel_from_string(std::string_view key) {
  for (const auto& s : PROFILES) {
    if (key == s.key) return s.channel;
  }
  return std::nullopt;
}

const char* to_string(Speed s) {
  switch (s) {
    case Speed::Instant: return "instant";
    case Speed::High:    return "high";
    case Speed::Medium:  return "medium";
    case Speed::Low:     return "low";
    case Speed::VeryLow: return "very_low";
  }
  return "low";
}

const char* to_string(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return "high";
    case Bandwidth::LowMedium: return "low_medium";
    case Bandwidth::Low:       return "low";
    case Bandwidth::VeryLow:   return "very_low";
  }
  return "low";
}

bool contains(const ChannelSet& set, Channel ch) {
  for (Channel c : set) {
    if (c == ch) return true;
  }
  return false;
}

void insert_unique(ChannelSet& set, Channel ch) {
  if (!contains(set, ch) && !set.full()) set.push_back(ch);
}

} // namespace meshrelay::transport
