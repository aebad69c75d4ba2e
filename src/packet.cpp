#include "meshrelay/packet.hpp"

#include "meshrelay/digest.hpp"

namespace meshrelay {

const char* to_string(PacketStatus s) {
  switch (s) {
    case PacketStatus::Pending:   return "pending";
    case PacketStatus::Delivered: return "delivered";
    case PacketStatus::Expired:   return "expired";
    case PacketStatus::Failed:    return "failed";
  }
  return "pending";
}

bool Packet::verify() const {
  if (payload_hash.empty()) return false;
  return sha256_hex(payload) == payload_hash;
}

std::optional<DataUnit> Packet::unit() const {
  return parse_unit(payload);
}

// -----------------------------------------------------------------------------
// build_packet()
// PRE:    unit is not null.
// POLICY: urgency comes from the explicit option, else from the class, else
//         General. Threat-or-higher urgency raises the priority-boost flag.
// OUT:    pending packet, hash over canonical bytes, fresh pkt_ id.
// -----------------------------------------------------------------------------
std::optional<Packet> build_packet(const DataUnit& unit, std::string_view destination_id,
                                   const PacketOptions& options) {
  if (unit.is_null()) return std::nullopt;

  Packet p;
  p.id             = make_id("pkt");
  p.source_id      = options.source_id;
  p.destination_id = destination_id.empty() ? std::string(BROADCAST) : std::string(destination_id);
  p.payload        = canonical(unit);
  p.payload_hash   = sha256_hex(p.payload);
  p.priority_class = options.priority_class;
  p.created_ms     = options.created_ms;

  if (options.urgency)             p.urgency = *options.urgency;
  else if (options.priority_class) p.urgency = urgency_for(*options.priority_class);

  MeshHeaderOptions ho;
  ho.sequence       = options.sequence;
  ho.total          = options.total;
  ho.ttl            = options.ttl;
  ho.store_forward  = options.store_forward;
  ho.priority_boost = p.urgency <= Urgency::Threat;
  p.header = MeshHeader(p.source_id, p.destination_id, p.payload_hash, ho);
  return p;
}

} // namespace meshrelay
