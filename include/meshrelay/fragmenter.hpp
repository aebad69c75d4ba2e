/**
 * @file fragmenter.hpp
 * @brief Split a data unit into chunks sized for the weakest link, and back.
 *
 * ---
 *
 * ## Purpose
 *
 * A 40 KB record will not fit a 242-byte LoRa frame. `fragment()` cuts the
 * canonical bytes of a unit into ordered chunks that each travel on their own.
 * `reassemble()` takes whatever arrived, in any order, and either rebuilds the
 * exact unit or refuses. It never hands back a partial unit.
 *
 * ---
 *
 * ## Rules
 *
 * - All chunks of one unit share a `transfer_id` (`xfer_…`).
 * - `index` runs 0..total-1; `total` is the same on every chunk.
 * - Each chunk carries a short SHA-256 of its bytes (`chunk_hash`, 16 hex).
 * - A unit that fits in one chunk still comes back as a one-element list.
 * - Cuts fall between UTF-8 characters, never inside one.
 * - `max_chunk_bytes == 0` is treated as 1. Any size ≥ 1 round-trips; a
 *   character wider than the limit travels alone in an oversize chunk.
 * - With `ChunkMeasure::JsonString` the limit applies to the chunk as it
 *   appears escaped inside a JSON string, which is how the runtime ships it.
 *
 * ---
 *
 * ## Refusals (`reassemble` → std::nullopt)
 *
 * | Condition                                   |
 * |---------------------------------------------|
 * | null or empty list                          |
 * | mixed transfer ids or totals                |
 * | duplicate index, index ≥ total              |
 * | index set ≠ 0..total-1 (something missing)  |
 * | chunk hash mismatch                         |
 * | joined bytes are not a valid unit           |
 */
#ifndef MESHRELAY_FRAGMENTER_HPP
#define MESHRELAY_FRAGMENTER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "meshrelay/data_unit.hpp"
#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

struct Fragment {
  std::string transfer_id;
  uint32_t    index{0};
  uint32_t    total{1};
  std::string chunk;
  std::string chunk_hash;
};

using FragmentList = std::vector<Fragment>;

/// How a chunk is measured against `max_chunk_bytes`.
enum class ChunkMeasure : uint8_t {
  Raw,
  JsonString
};

/// Null unit → empty list.
FragmentList fragment(const DataUnit& unit, size_t max_chunk_bytes,
                      ChunkMeasure measure = ChunkMeasure::Raw);

std::optional<DataUnit> reassemble(const FragmentList* fragments);
std::optional<DataUnit> reassemble(const FragmentList& fragments);

/// Per-fragment payload room on a channel: max(max_payload − 64, 64).
size_t chunk_size_for(transport::Channel ch);

/// Bytes one input byte takes once escaped in a JSON string (1, 2 or 6).
size_t json_escaped_size(unsigned char c);

/// ceil(bytes / chunk), at least 1. A planning estimate; `fragment()` may
/// produce more pieces once character boundaries are respected.
size_t fragment_count(size_t payload_bytes, size_t chunk_bytes);

} // namespace meshrelay

#endif // MESHRELAY_FRAGMENTER_HPP
