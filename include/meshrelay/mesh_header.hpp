/**
 * @file mesh_header.hpp
 * @brief MeshHeader: the 16-byte routing envelope on every packet.
 *
 * @details
 * Every packet starts with this header. It tells a relay node where a packet
 * came from, where it is going, how many more hops it may take, and whether
 * it is one piece of something larger, without parsing the payload.
 *
 * @section meshrelay_header_layout Byte layout (big-endian)
 *
 * | Byte  | Field        | Description                                     |
 * |-------|--------------|-------------------------------------------------|
 * | 0–3   | source       | short id of the sender                          |
 * | 4–7   | destination  | short id of the recipient, 0xFFFFFFFF broadcast |
 * | 8–11  | hash         | first 4 bytes of the payload SHA-256            |
 * | 12    | sequence     | fragment index (0–255)                          |
 * | 13    | total        | fragment count (1–255)                          |
 * | 14    | ttl          | hops remaining (0–255)                          |
 * | 15    | flags        | `MeshFlags` byte, shared with Frame             |
 *
 * Short ids are derived from full node ids with `short_node_id()`. The header
 * plus the 48-byte unit-metadata block is the fixed 64-byte packet overhead.
 *
 * ### Clamping
 * Out-of-range inputs never wrap. `ttl = 300` becomes 255, `ttl = -5`
 * becomes 0; sequence is clamped to 0–255 and total to 1–255. Total above 1
 * raises the fragment flag automatically.
 *
 * ### Example
 * `to_hex_string()` of a broadcast header from a node whose short id is
 * 0x1A2B3C4D, hash 0xDEADBEEF, single part, ttl 7, no flags:
 * `1A2B3C4DFFFFFFFFDEADBEEF00010700`
 */
#ifndef MESHRELAY_MESH_HEADER_HPP
#define MESHRELAY_MESH_HEADER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "etl/string.h"

#include "meshrelay/constants.hpp"
#include "meshrelay/urgency.hpp"

namespace meshrelay {

/**
 * @brief Raw, unclamped inputs for building a header.
 */
struct MeshHeaderOptions {
  int                sequence{0};
  int                total{1};
  std::optional<int> ttl;              ///< absent → TTL_DEFAULT
  bool               priority_boost{false};
  bool               store_forward{false};
};

struct MeshHeader {
  uint32_t  source{0};
  uint32_t  destination{BROADCAST_SHORT_ID};
  uint32_t  hash{0};
  uint8_t   sequence{0};
  uint8_t   total{1};
  uint8_t   ttl{TTL_DEFAULT};
  MeshFlags flags;

  MeshHeader() = default;

  /**
   * @brief Build from full ids and a hex content hash.
   * @param source_id       full sender id (e.g. "node_4f2b…")
   * @param destination_id  full recipient id, or "broadcast" / empty
   * @param content_hash_hex at least 8 hex chars; fewer → hash 0
   */
  MeshHeader(std::string_view source_id, std::string_view destination_id,
             std::string_view content_hash_hex, const MeshHeaderOptions& options = {});

  /// Unpack from a received buffer; a short buffer leaves the defaults.
  MeshHeader(const uint8_t* data, size_t len);

  void pack(uint8_t* out_buf) const;               ///< writes MESH_HEADER_SIZE bytes
  bool unpack(const uint8_t* in_buf, size_t len);  ///< false if len < MESH_HEADER_SIZE

  bool is_broadcast()  const { return destination == BROADCAST_SHORT_ID; }
  bool is_fragmented() const { return flags.fragment(); }

  /// 32 uppercase hex characters.
  etl::string<32> to_hex_string() const;

  static uint8_t clamp_ttl(int ttl);
  static uint8_t clamp_sequence(int seq);
  static uint8_t clamp_total(int total);
};

} // namespace meshrelay

#endif // MESHRELAY_MESH_HEADER_HPP
