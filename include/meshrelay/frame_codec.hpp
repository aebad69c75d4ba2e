/**
 * @file frame_codec.hpp
 * @brief Frame: the CRC-checked wire envelope for anything crossing a channel.
 *
 * @details
 * ## Field Brief
 * A Frame is what actually touches the medium. It is small, versioned, and
 * self-checking: a receiver can reject garbage before spending a single cycle
 * on JSON. Packets (packet.hpp) ride inside frames when they leave a node.
 *
 * ---
 *
 * @par Wire layout (big-endian, 20 bytes overhead)
 *
 * | Offset | Size | Field            | Notes                                   |
 * |--------|------|------------------|-----------------------------------------|
 * | 0      | 2    | magic            | always 0xCD01                           |
 * | 2      | 1    | version          | 1                                       |
 * | 3      | 1    | priority         | 0 (emergency) … 7 (minimal)             |
 * | 4      | 1    | ttl              | hops remaining                          |
 * | 5      | 1    | flags            | `MeshFlags` byte                        |
 * | 6      | 4    | content_hash     | first 4 bytes of SHA-256(payload)       |
 * | 10     | 4    | source           | short node id                           |
 * | 14     | 1    | fragment_seq     |                                         |
 * | 15     | 1    | fragment_total   |                                         |
 * | 16     | 2    | payload_length   | N                                       |
 * | 18     | N    | payload          | canonical data unit bytes               |
 * | 18+N   | 2    | crc16            | CRC-16/MODBUS over bytes [0, 18+N)      |
 *
 * ---
 *
 * @par Failure Model
 * `decode_frame()` checks in this order and stops at the first failure:
 * null input → `missing_required_input`; fewer than 2 bytes → `truncated_frame`;
 * magic → `invalid_magic`; length → `truncated_frame`; version →
 * `unsupported_version`; CRC → `crc_mismatch`; JSON → `malformed_payload`.
 * Nothing throws. A corrupt frame costs exactly that frame.
 *
 * @par Priority and emergency
 * Priority is clamped to [0,7]. Levels 0 and 1 always raise the emergency
 * flag so gossip never suppresses them, whatever the caller asked for.
 */
#ifndef MESHRELAY_FRAME_CODEC_HPP
#define MESHRELAY_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "meshrelay/constants.hpp"
#include "meshrelay/data_unit.hpp"
#include "meshrelay/error.hpp"
#include "meshrelay/urgency.hpp"

namespace meshrelay {

struct FrameOptions {
  int         priority{static_cast<int>(Urgency::General)};
  int         ttl{TTL_DEFAULT};
  bool        fragment{false};
  bool        relay{false};
  bool        emergency{false};
  bool        encrypted{false};
  std::string source_node;          // full node id; empty → 0
  uint8_t     fragment_seq{0};
  uint8_t     fragment_total{1};
};

struct Frame {
  uint16_t    magic{FRAME_MAGIC};
  uint8_t     version{FRAME_VERSION};
  Urgency     priority{Urgency::General};
  uint8_t     ttl{TTL_DEFAULT};
  MeshFlags   flags;
  uint32_t    content_hash{0};
  uint32_t    source{0};
  uint8_t     fragment_seq{0};
  uint8_t     fragment_total{1};
  std::string payload;
  uint16_t    crc{0};

  size_t payload_length() const { return payload.size(); }
  size_t total_bytes() const { return FRAME_OVERHEAD + payload.size(); }

  /// CRC over the header and payload as they would be packed.
  uint16_t compute_crc() const;

  /// Wire bytes, stored `crc` appended as-is.
  std::vector<uint8_t> pack() const;
};

struct FrameDecodeResult {
  bool      ok{false};
  MeshError error{MeshError::None};
  Frame     frame;
  DataUnit  unit;
  bool      fragment{false};
  bool      relay{false};
  bool      emergency{false};
  bool      encrypted{false};
};

/// Null unit or oversize payload → std::nullopt.
std::optional<Frame> encode_frame(const DataUnit& unit, const FrameOptions& options = {});

FrameDecodeResult decode_frame(const uint8_t* data, size_t len);
FrameDecodeResult decode_frame(const std::vector<uint8_t>& bytes);

} // namespace meshrelay

#endif // MESHRELAY_FRAME_CODEC_HPP
