// -----------------------------------------------------------------------------
// mesh_header.cpp: MeshHeader construction, packing and hex rendering
//
// All methods are allocation-free except the digest used to shorten ids.
// -----------------------------------------------------------------------------
#include "meshrelay/mesh_header.hpp"

#include "meshrelay/digest.hpp"

#include <algorithm>

namespace meshrelay {

namespace {

bool hex_val(char c, uint8_t& out) {
  if (c >= '0' && c <= '9') { out = static_cast<uint8_t>(c - '0'); return true; }
  if (c >= 'a' && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
  if (c >= 'A' && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
  return false;
}

// First 8 hex chars → u32; anything malformed → 0.
uint32_t parse_hash_prefix(std::string_view hex) {
  if (hex.size() < 8) return 0;
  uint32_t v = 0;
  for (size_t i = 0; i < 8; ++i) {
    uint8_t nib = 0;
    if (!hex_val(hex[i], nib)) return 0;
    v = (v << 4) | nib;
  }
  return v;
}

void put_u32(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v >> 24);
  p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[3] = static_cast<uint8_t>(v & 0xFF);
}

uint32_t get_u32(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

// =============================================================================
// Clamping
// =============================================================================

uint8_t MeshHeader::clamp_ttl(int ttl) {
  return static_cast<uint8_t>(std::clamp(ttl, TTL_MIN, TTL_MAX));
}

uint8_t MeshHeader::clamp_sequence(int seq) {
  return static_cast<uint8_t>(std::clamp(seq, 0, 255));
}

uint8_t MeshHeader::clamp_total(int total) {
  return static_cast<uint8_t>(std::clamp(total, 1, static_cast<int>(FRAGMENT_TOTAL_MAX)));
}

// =============================================================================
// Constructors
// =============================================================================

MeshHeader::MeshHeader(std::string_view source_id, std::string_view destination_id,
                       std::string_view content_hash_hex, const MeshHeaderOptions& options)
    : source(short_node_id(source_id)),
      destination(short_node_id(destination_id)),   // empty / "broadcast" → 0xFFFFFFFF
      hash(parse_hash_prefix(content_hash_hex)),
      sequence(clamp_sequence(options.sequence)),
      total(clamp_total(options.total)),
      ttl(clamp_ttl(options.ttl.value_or(TTL_DEFAULT))) {
  flags.set(MeshFlags::PRIORITY_BOOST, options.priority_boost);
  flags.set(MeshFlags::STORE_FORWARD,  options.store_forward);
  flags.set(MeshFlags::FRAGMENT,       total > 1);
}

MeshHeader::MeshHeader(const uint8_t* data, size_t len) {
  unpack(data, len);
}

// =============================================================================
// Packing & Unpacking
// =============================================================================

void MeshHeader::pack(uint8_t* out_buf) const {
  if (!out_buf) return;
  put_u32(out_buf + 0, source);
  put_u32(out_buf + 4, destination);
  put_u32(out_buf + 8, hash);
  out_buf[12] = sequence;
  out_buf[13] = total;
  out_buf[14] = ttl;
  out_buf[15] = flags.bits;
}

bool MeshHeader::unpack(const uint8_t* in_buf, size_t len) {
  if (!in_buf || len < MESH_HEADER_SIZE) return false;
  source      = get_u32(in_buf + 0);
  destination = get_u32(in_buf + 4);
  hash        = get_u32(in_buf + 8);
  sequence    = in_buf[12];
  total       = in_buf[13] == 0 ? 1 : in_buf[13];   // 0 parts is not a thing
  ttl         = in_buf[14];
  flags       = MeshFlags(in_buf[15]);
  return true;
}

etl::string<32> MeshHeader::to_hex_string() const {
  uint8_t buf[MESH_HEADER_SIZE];
  pack(buf);
  etl::string<32> hex;
  for (size_t i = 0; i < MESH_HEADER_SIZE; ++i) {
    hex += "0123456789ABCDEF"[buf[i] >> 4];
    hex += "0123456789ABCDEF"[buf[i] & 0x0F];
  }
  return hex;
}

} // namespace meshrelay
