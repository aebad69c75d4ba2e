// -----------------------------------------------------------------------------
// fragmenter.cpp: chunking and order-independent reassembly
//
// Splitting works on the canonical form and only cuts between UTF-8
// characters. A chunk travels as a JSON string, and a torn multi-byte
// sequence would not survive that trip.
// -----------------------------------------------------------------------------
#include "meshrelay/fragmenter.hpp"

#include "meshrelay/constants.hpp"
#include "meshrelay/digest.hpp"
#include "meshrelay/log.hpp"

#include <algorithm>

namespace meshrelay {

namespace {

std::string chunk_digest(const std::string& chunk) {
  return sha256_hex(chunk).substr(0, FRAGMENT_HASH_HEX);
}

// Length of the UTF-8 character starting at `pos`. A stray continuation or
// invalid lead byte counts as one.
size_t utf8_length_at(const std::string& bytes, size_t pos) {
  const auto lead = static_cast<unsigned char>(bytes[pos]);
  size_t n = 1;
  if      ((lead & 0xE0) == 0xC0) n = 2;
  else if ((lead & 0xF0) == 0xE0) n = 3;
  else if ((lead & 0xF8) == 0xF0) n = 4;
  return std::min(n, bytes.size() - pos);
}

size_t measured_size(const std::string& bytes, size_t pos, size_t len, ChunkMeasure measure) {
  if (measure == ChunkMeasure::Raw) return len;
  size_t n = 0;
  for (size_t i = pos; i < pos + len; ++i) n += json_escaped_size(static_cast<unsigned char>(bytes[i]));
  return n;
}

} // namespace

// -----------------------------------------------------------------------------
// fragment()
// PRE:    unit not null.
// POLICY: one transfer id per call; chunk size floored at 1. Cuts fall
//         between characters; a character larger than the limit goes alone.
// OUT:    fragments in index order.
// -----------------------------------------------------------------------------
FragmentList fragment(const DataUnit& unit, size_t max_chunk_bytes, ChunkMeasure measure) {
  FragmentList out;
  if (unit.is_null()) return out;

  const size_t limit = std::max<size_t>(max_chunk_bytes, 1);
  const std::string bytes = canonical(unit);

  std::vector<std::string> chunks;
  size_t pos = 0;
  while (pos < bytes.size()) {
    size_t end = pos, used = 0;
    while (end < bytes.size()) {
      const size_t len  = utf8_length_at(bytes, end);
      const size_t cost = measured_size(bytes, end, len, measure);
      if (end > pos && used + cost > limit) break;
      used += cost;
      end  += len;
    }
    chunks.push_back(bytes.substr(pos, end - pos));
    pos = end;
  }

  const std::string transfer_id = make_id("xfer");
  const auto total = static_cast<uint32_t>(chunks.size());
  out.reserve(chunks.size());
  for (uint32_t i = 0; i < total; ++i) {
    Fragment f;
    f.transfer_id = transfer_id;
    f.index       = i;
    f.total       = total;
    f.chunk       = std::move(chunks[i]);
    f.chunk_hash  = chunk_digest(f.chunk);
    out.push_back(std::move(f));
  }
  return out;
}

// -----------------------------------------------------------------------------
// reassemble()
// POLICY: all-or-nothing. Any inconsistency returns nullopt; see header table.
// -----------------------------------------------------------------------------
std::optional<DataUnit> reassemble(const FragmentList* fragments) {
  if (!fragments || fragments->empty()) return std::nullopt;

  const Fragment& first = fragments->front();
  const uint32_t total = first.total;
  if (total == 0 || fragments->size() != total) return std::nullopt;   // missing or extra parts

  std::vector<const Fragment*> slots(total, nullptr);
  for (const Fragment& f : *fragments) {
    if (f.transfer_id != first.transfer_id || f.total != total) return std::nullopt;
    if (f.index >= total || slots[f.index]) return std::nullopt;        // out of range / duplicate
    if (!f.chunk_hash.empty() && chunk_digest(f.chunk) != f.chunk_hash) {
      log::warn("fragment", "chunk " + std::to_string(f.index) + " of " + f.transfer_id
                            + " failed its hash check");
      return std::nullopt;
    }
    slots[f.index] = &f;
  }

  std::string joined;
  for (const Fragment* f : slots) joined += f->chunk;   // every slot filled: size == total, no dupes
  return parse_unit(joined);
}

std::optional<DataUnit> reassemble(const FragmentList& fragments) {
  return reassemble(&fragments);
}

size_t json_escaped_size(unsigned char c) {
  switch (c) {
    case '"': case '\\':
    case '\b': case '\f': case '\n': case '\r': case '\t':
      return 2;
    default:
      return c < 0x20 ? 6 : 1;   // six-byte unicode escape
  }
}

size_t chunk_size_for(transport::Channel ch) {
  const size_t max = transport::profile(ch).max_payload_bytes;
  const size_t room = max > PACKET_OVERHEAD ? max - PACKET_OVERHEAD : 0;
  return std::max(room, FRAGMENT_CHUNK_FLOOR);
}

size_t fragment_count(size_t payload_bytes, size_t chunk_bytes) {
  if (chunk_bytes == 0) chunk_bytes = 1;
  if (payload_bytes == 0) return 1;
  return (payload_bytes + chunk_bytes - 1) / chunk_bytes;
}

} // namespace meshrelay
