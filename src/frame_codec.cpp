// -----------------------------------------------------------------------------
// frame_codec.cpp: Frame encode / pack / decode
//
// API & wire layout:
//   see include/meshrelay/frame_codec.hpp
//
// NOTE: encode never touches the network and decode never throws. Both are
// pure functions of their inputs; counters live in the runtime.
// -----------------------------------------------------------------------------
#include "meshrelay/frame_codec.hpp"

#include "meshrelay/digest.hpp"
#include "meshrelay/log.hpp"

#include <algorithm>

namespace meshrelay {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t get_u16(const uint8_t* p) {
  return static_cast<uint16_t>((uint16_t(p[0]) << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

// Header + payload, no CRC. Shared by pack() and compute_crc().
std::vector<uint8_t> body_bytes(const Frame& f) {
  std::vector<uint8_t> out;
  out.reserve(f.total_bytes());
  put_u16(out, f.magic);
  out.push_back(f.version);
  out.push_back(static_cast<uint8_t>(f.priority));
  out.push_back(f.ttl);
  out.push_back(f.flags.bits);
  put_u32(out, f.content_hash);
  put_u32(out, f.source);
  out.push_back(f.fragment_seq);
  out.push_back(f.fragment_total);
  put_u16(out, static_cast<uint16_t>(f.payload.size()));
  out.insert(out.end(), f.payload.begin(), f.payload.end());
  return out;
}

uint32_t hash_prefix(const std::string& payload) {
  Sha256 d{};
  if (!sha256(payload, d)) return 0;
  return get_u32(d.data());
}

FrameDecodeResult fail(MeshError e) {
  FrameDecodeResult r;
  r.ok = false;
  r.error = e;
  return r;
}

} // namespace

// ---------- Frame ----------

uint16_t Frame::compute_crc() const {
  const auto body = body_bytes(*this);
  return crc16(body.data(), body.size());
}

std::vector<uint8_t> Frame::pack() const {
  auto out = body_bytes(*this);
  put_u16(out, crc);
  return out;
}

// ---------- encode ----------

// -----------------------------------------------------------------------------
// encode_frame()
// PRE:    unit is not null; canonical payload fits the 16-bit length field.
// POLICY: priority clamped to [0,7]; 0/1 force the emergency flag; a fragment
//         total above 1 forces the fragment flag.
// OUT:    frame with crc already computed.
// -----------------------------------------------------------------------------
std::optional<Frame> encode_frame(const DataUnit& unit, const FrameOptions& options) {
  if (unit.is_null()) return std::nullopt;

  Frame f;
  f.payload = canonical(unit);
  if (f.payload.size() > FRAME_MAX_PAYLOAD) {
    log::warn("frame", "payload of " + std::to_string(f.payload.size())
                       + " bytes exceeds frame limit; fragment first");
    return std::nullopt;
  }

  f.priority       = urgency_from_int(options.priority);
  f.ttl            = static_cast<uint8_t>(std::clamp(options.ttl, TTL_MIN, TTL_MAX));
  f.content_hash   = hash_prefix(f.payload);
  f.source         = options.source_node.empty() ? 0 : short_node_id(options.source_node);
  f.fragment_seq   = options.fragment_seq;
  f.fragment_total = options.fragment_total == 0 ? 1 : options.fragment_total;

  const bool urgent = f.priority == Urgency::Emergency || f.priority == Urgency::Threat;
  f.flags.set(MeshFlags::FRAGMENT,  options.fragment || f.fragment_total > 1);
  f.flags.set(MeshFlags::RELAY,     options.relay);
  f.flags.set(MeshFlags::EMERGENCY, options.emergency || urgent);
  f.flags.set(MeshFlags::ENCRYPTED, options.encrypted);

  f.crc = f.compute_crc();
  return f;
}

// ---------- decode ----------

FrameDecodeResult decode_frame(const uint8_t* data, size_t len) {
  if (!data) return fail(MeshError::MissingRequiredInput);   // null is an error, not a crash
  if (len < 2) return fail(MeshError::TruncatedFrame);

  if (get_u16(data) != FRAME_MAGIC) return fail(MeshError::InvalidMagic);
  if (len < FRAME_OVERHEAD) return fail(MeshError::TruncatedFrame);

  const size_t payload_len = get_u16(data + 16);
  if (len != FRAME_OVERHEAD + payload_len) return fail(MeshError::TruncatedFrame);
  if (data[2] != FRAME_VERSION) return fail(MeshError::UnsupportedVersion);

  const size_t crc_at = FRAME_HEADER_SIZE + payload_len;
  const uint16_t stored   = get_u16(data + crc_at);
  const uint16_t computed = crc16(data, crc_at);
  if (stored != computed) return fail(MeshError::CrcMismatch);

  FrameDecodeResult r;
  Frame& f = r.frame;
  f.magic          = FRAME_MAGIC;
  f.version        = data[2];
  f.priority       = urgency_from_int(data[3]);
  f.ttl            = data[4];
  f.flags          = MeshFlags(data[5]);
  f.content_hash   = get_u32(data + 6);
  f.source         = get_u32(data + 10);
  f.fragment_seq   = data[14];
  f.fragment_total = data[15];
  f.payload.assign(reinterpret_cast<const char*>(data + FRAME_HEADER_SIZE), payload_len);
  f.crc            = stored;

  auto unit = parse_unit(f.payload);
  if (!unit) return fail(MeshError::MalformedPayload);

  r.ok        = true;
  r.unit      = std::move(*unit);
  r.fragment  = f.flags.fragment();
  r.relay     = f.flags.relay();
  r.emergency = f.flags.emergency();
  r.encrypted = f.flags.encrypted();
  return r;
}

FrameDecodeResult decode_frame(const std::vector<uint8_t>& bytes) {
  // empty vector still carries a valid (possibly null) data(); treat as truncated
  if (bytes.empty()) return fail(MeshError::TruncatedFrame);
  return decode_frame(bytes.data(), bytes.size());
}

} // namespace meshrelay
