/**
 * @file packet.hpp
 * @brief Packet: one data unit wrapped for mesh delivery.
 *
 * @details
 * ## Field Brief
 * A Packet is header + canonical payload + SHA-256 of that payload. The hash
 * travels with the packet so the far end can prove nobody touched the bytes
 * on the way (`verify()`), whatever channels and relays it crossed.
 *
 * ---
 *
 * @par Size accounting
 * `payload_bytes()` and `total_bytes()` are computed from the payload on every
 * call. Routing sizes channels from `total_bytes()`; a cached count would let
 * a mutated payload slip past the fragmenter.
 *
 * `total_bytes() == payload_bytes() + PACKET_OVERHEAD` (64).
 *
 * ---
 *
 * @par Priority
 * Callers should set `priority_class` when they build the packet. When it is
 * missing the relay queue falls back to keyword inspection of the payload
 * (`classify_priority`), which is a compatibility shim and can misfile.
 */
#ifndef MESHRELAY_PACKET_HPP
#define MESHRELAY_PACKET_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "meshrelay/data_unit.hpp"
#include "meshrelay/mesh_header.hpp"
#include "meshrelay/transport/channel.hpp"
#include "meshrelay/urgency.hpp"

namespace meshrelay {

enum class PacketStatus : uint8_t { Pending, Delivered, Expired, Failed };

const char* to_string(PacketStatus s);

struct PacketOptions {
  std::string               source_id;        ///< full sender id; empty → short id 0
  std::optional<RelayClass> priority_class;
  std::optional<Urgency>    urgency;          ///< absent → derived from class, else General
  std::optional<int>        ttl;
  bool                      store_forward{false};
  int                       sequence{0};
  int                       total{1};
  uint64_t                  created_ms{0};
};

struct Packet {
  std::string               id;
  MeshHeader                header;
  std::string               source_id;
  std::string               destination_id;
  std::string               payload;          ///< canonical unit bytes
  std::string               payload_hash;     ///< SHA-256 hex of payload at build time
  PacketStatus              status{PacketStatus::Pending};
  std::optional<RelayClass> priority_class;
  Urgency                   urgency{Urgency::General};
  std::optional<transport::Channel> channel;
  uint64_t                  created_ms{0};

  size_t payload_bytes() const { return payload.size(); }
  size_t total_bytes() const { return payload.size() + PACKET_OVERHEAD; }

  /// Recompute the payload hash and compare.
  bool verify() const;

  /// Parse the payload back into a unit.
  std::optional<DataUnit> unit() const;
};

/// Null unit → std::nullopt. Empty destination means broadcast.
std::optional<Packet> build_packet(const DataUnit& unit, std::string_view destination_id,
                                   const PacketOptions& options = {});

} // namespace meshrelay

#endif // MESHRELAY_PACKET_HPP
