// -----------------------------------------------------------------------------
// json_codec.cpp: record <-> JSON, file helpers
//
// Readers never throw: every typed read goes through take(), which checks the
// JSON type first. Files are read with the non-throwing parse overload and
// written through a temp file.
// -----------------------------------------------------------------------------
#include "meshrelay/json_codec.hpp"

#include "meshrelay/digest.hpp"
#include "meshrelay/log.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace meshrelay {
namespace codec {

using transport::Channel;
using transport::ChannelSet;

namespace {

using TypeCheck = bool (json::*)() const noexcept;

// Absent → true, out untouched. Present with the wrong type → false.
template <typename T>
bool take(const json& j, const char* key, T& out, TypeCheck is_type) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!((*it).*is_type)()) return false;
  out = it->get<T>();
  return true;
}

std::string hex32(uint32_t v) {
  const uint8_t b[4] = {
    static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16),
    static_cast<uint8_t>(v >> 8),  static_cast<uint8_t>(v)
  };
  return to_hex(b, sizeof(b));
}

json channel_or_null(const std::optional<Channel>& ch) {
  return ch ? json(transport::to_string(*ch)) : json(nullptr);
}

json error_or_null(MeshError e) {
  return e == MeshError::None ? json(nullptr) : json(to_string(e));
}

} // namespace

// ---------- channels ----------

json to_json(const ChannelSet& set) {
  json a = json::array();
  for (auto ch : set) a.push_back(transport::to_string(ch));
  return a;
}

json to_json(const std::vector<transport::ChannelStatus>& report) {
  json a = json::array();
  for (const auto& st : report) {
    if (!st.profile) continue;
    json e;
    e["channel"]     = st.profile->key;
    e["name"]        = st.profile->name;
    e["protocol"]    = st.profile->protocol;
    e["range"]       = st.profile->range;
    e["speed"]       = transport::to_string(st.profile->speed);
    e["bandwidth"]   = transport::to_string(st.profile->bandwidth);
    e["priority"]    = st.profile->priority;
    e["maxPayload"]  = st.profile->max_payload_bytes;
    e["available"]   = st.available;
    e["latencyMs"]   = st.latency_ms ? json(*st.latency_ms) : json(nullptr);
    a.push_back(e);
  }
  return a;
}

std::optional<ChannelSet> channels_from_json(const json& j) {
  if (!j.is_array()) return std::nullopt;
  ChannelSet set;
  for (const auto& v : j) {
    if (!v.is_string()) return std::nullopt;
    auto ch = transport::channel_from_string(v.get<std::string>());
    if (!ch) return std::nullopt;
    transport::insert_unique(set, *ch);
  }
  return set;
}

// ---------- peers ----------

json to_json(const Peer& p) {
  json j;
  j["nodeId"]          = p.node_id;
  j["channels"]        = to_json(p.channels);
  j["relayCapable"]    = p.relay_capable;
  j["discoveryMethod"] = p.discovery_method;
  j["version"]         = p.version;
  j["latencyMs"]       = p.latency_ms ? json(*p.latency_ms) : json(nullptr);
  j["transmissions"]   = p.transmissions;
  j["firstSeen"]       = p.first_seen_ms;
  j["lastSeen"]        = p.last_seen_ms;
  return j;
}

std::optional<Peer> peer_from_json(const json& j) {
  if (!j.is_object()) return std::nullopt;
  Peer p;
  bool ok = take(j, "nodeId", p.node_id, &json::is_string)
         && take(j, "relayCapable", p.relay_capable, &json::is_boolean)
         && take(j, "discoveryMethod", p.discovery_method, &json::is_string)
         && take(j, "version", p.version, &json::is_string)
         && take(j, "transmissions", p.transmissions, &json::is_number_unsigned)
         && take(j, "firstSeen", p.first_seen_ms, &json::is_number_unsigned)
         && take(j, "lastSeen", p.last_seen_ms, &json::is_number_unsigned);
  if (!ok || p.node_id.empty()) return std::nullopt;

  uint32_t latency = 0;
  if (j.contains("latencyMs") && !j["latencyMs"].is_null()) {
    if (!take(j, "latencyMs", latency, &json::is_number_unsigned)) return std::nullopt;
    p.latency_ms = latency;
  }
  if (auto it = j.find("channels"); it != j.end()) {
    auto set = channels_from_json(*it);
    if (!set) return std::nullopt;
    p.channels = *set;
  }
  return p;
}

json to_json(const Topology& t) {
  json j;
  j["selfId"] = t.self_id;
  json nodes = json::array();
  for (const auto& p : t.nodes) nodes.push_back(to_json(p));
  j["nodes"]          = nodes;
  j["totalNodes"]     = t.total_nodes;
  j["activeChannels"] = to_json(t.active_channels);
  return j;
}

// ---------- packets ----------

json to_json(const MeshHeader& h) {
  json j;
  j["source"]      = h.source;
  j["destination"] = h.destination;
  j["hash"]        = h.hash;
  j["sequence"]    = h.sequence;
  j["total"]       = h.total;
  j["ttl"]         = h.ttl;
  j["flags"]       = h.flags.bits;
  j["hex"]         = std::string(h.to_hex_string().c_str());
  return j;
}

json to_json(const Packet& p) {
  json j;
  j["id"]            = p.id;
  j["header"]        = to_json(p.header);
  j["sourceId"]      = p.source_id;
  j["destinationId"] = p.destination_id;
  j["payload"]       = p.payload;
  j["payloadHash"]   = p.payload_hash;
  j["status"]        = to_string(p.status);
  j["priorityClass"] = p.priority_class ? json(static_cast<int>(*p.priority_class)) : json(nullptr);
  j["urgency"]       = static_cast<int>(p.urgency);
  j["channel"]       = channel_or_null(p.channel);
  j["createdAt"]     = p.created_ms;
  j["totalBytes"]    = p.total_bytes();
  return j;
}

std::optional<Packet> packet_from_json(const json& j) {
  if (!j.is_object()) return std::nullopt;
  Packet p;
  int urgency = static_cast<int>(Urgency::General);
  bool ok = take(j, "id", p.id, &json::is_string)
         && take(j, "sourceId", p.source_id, &json::is_string)
         && take(j, "destinationId", p.destination_id, &json::is_string)
         && take(j, "payload", p.payload, &json::is_string)
         && take(j, "payloadHash", p.payload_hash, &json::is_string)
         && take(j, "urgency", urgency, &json::is_number_integer)
         && take(j, "createdAt", p.created_ms, &json::is_number_unsigned);
  if (!ok || p.id.empty()) return std::nullopt;
  p.urgency = urgency_from_int(urgency);

  int cls = 0;
  if (!take(j, "priorityClass", cls, &json::is_number_integer)) return std::nullopt;
  if (cls != 0) p.priority_class = relay_class_from_int(cls);

  std::string status;
  if (!take(j, "status", status, &json::is_string)) return std::nullopt;
  if (status == "delivered")    p.status = PacketStatus::Delivered;
  else if (status == "expired") p.status = PacketStatus::Expired;
  else if (status == "failed")  p.status = PacketStatus::Failed;

  std::string channel;
  if (!take(j, "channel", channel, &json::is_string)) return std::nullopt;
  if (!channel.empty()) p.channel = transport::channel_from_string(channel);

  if (auto it = j.find("header"); it != j.end() && it->is_object()) {
    const json& h = *it;
    uint8_t flags = 0;
    ok = take(h, "source", p.header.source, &json::is_number_unsigned)
      && take(h, "destination", p.header.destination, &json::is_number_unsigned)
      && take(h, "hash", p.header.hash, &json::is_number_unsigned)
      && take(h, "sequence", p.header.sequence, &json::is_number_unsigned)
      && take(h, "total", p.header.total, &json::is_number_unsigned)
      && take(h, "ttl", p.header.ttl, &json::is_number_unsigned)
      && take(h, "flags", flags, &json::is_number_unsigned);
    if (!ok) return std::nullopt;
    p.header.flags = MeshFlags(flags);
  }
  return p;
}

json to_json(const Fragment& f) {
  json j;
  j["transferId"] = f.transfer_id;
  j["index"]      = f.index;
  j["total"]      = f.total;
  j["chunk"]      = f.chunk;
  j["chunkHash"]  = f.chunk_hash;
  return j;
}

std::optional<Fragment> fragment_from_json(const json& j) {
  if (!j.is_object()) return std::nullopt;
  Fragment f;
  bool ok = take(j, "transferId", f.transfer_id, &json::is_string)
         && take(j, "index", f.index, &json::is_number_unsigned)
         && take(j, "total", f.total, &json::is_number_unsigned)
         && take(j, "chunk", f.chunk, &json::is_string)
         && take(j, "chunkHash", f.chunk_hash, &json::is_string);
  if (!ok || f.transfer_id.empty()) return std::nullopt;
  return f;
}

// ---------- frames ----------

json to_json(const Frame& f) {
  json j;
  j["magic"]         = f.magic;
  j["version"]       = f.version;
  j["priority"]      = static_cast<int>(f.priority);
  j["ttl"]           = f.ttl;
  j["flags"]         = f.flags.bits;
  j["contentHash"]   = hex32(f.content_hash);
  j["source"]        = hex32(f.source);
  j["fragmentSeq"]   = f.fragment_seq;
  j["fragmentTotal"] = f.fragment_total;
  j["payloadLength"] = f.payload_length();
  j["crc"]           = f.crc;
  j["totalBytes"]    = f.total_bytes();
  return j;
}

json to_json(const FrameDecodeResult& r) {
  json j;
  j["ok"]    = r.ok;
  j["error"] = error_or_null(r.error);
  if (!r.ok) return j;
  j["frame"]     = to_json(r.frame);
  j["unit"]      = r.unit;
  j["fragment"]  = r.fragment;
  j["relay"]     = r.relay;
  j["emergency"] = r.emergency;
  j["encrypted"] = r.encrypted;
  return j;
}

// ---------- routing & relay ----------

json to_json(const RouteDecision& d) {
  json j;
  j["channel"]            = channel_or_null(d.channel);
  j["mode"]               = to_string(d.mode);
  j["needsFragmentation"] = d.needs_fragmentation;
  j["fragmentCount"]      = d.fragment_count;
  j["score"]              = d.score;
  j["alternates"]         = to_json(d.alternates);
  j["reason"]             = d.reason;
  return j;
}

json to_json(const RelayConfig& c) {
  return json{{"enabled", c.enabled}, {"maxQueueSize", c.max_queue_size},
              {"holdTimeMs", c.max_hold_time_ms}};
}

json to_json(const RelayEntry& e) {
  json j;
  j["id"]            = e.id;
  j["packetId"]      = e.packet.id;
  j["destinationId"] = e.destination_id;
  j["priorityClass"] = static_cast<int>(e.priority_class);
  j["className"]     = to_string(e.priority_class);
  j["queuedAt"]      = e.queued_at_ms;
  j["expiresAt"]     = e.expires_at_ms;
  j["attempts"]      = e.attempts;
  j["maxAttempts"]   = e.max_attempts;
  j["status"]        = to_string(e.status);
  j["payloadBytes"]  = e.packet.payload_bytes();
  return j;
}

json to_json(const EnqueueResult& r) {
  json j;
  j["queued"] = r.queued;
  j["error"]  = error_or_null(r.error);
  j["priorityClass"] = static_cast<int>(r.priority_class);
  if (r.queued) {
    j["relayId"]   = r.relay_id;
    j["expiresAt"] = r.expires_at_ms;
  }
  if (!r.evicted_id.empty()) j["evictedId"] = r.evicted_id;
  return j;
}

json to_json(const DrainReport& r) {
  return json{{"delivered", r.delivered}, {"remaining", r.remaining},
              {"expired", r.expired}, {"failed", r.failed}};
}

json to_json(const MultiPathPlan& plan) {
  json j;
  j["ok"]    = plan.ok;
  j["error"] = error_or_null(plan.error);
  json paths = json::array();
  for (const auto& p : plan.paths) {
    json e;
    e["channel"]          = transport::to_string(p.channel);
    e["componentCount"]   = p.components.size();
    e["estimatedLatency"] = to_string(p.estimated_latency);
    paths.push_back(e);
  }
  j["paths"]           = paths;
  j["totalComponents"] = plan.total_components;
  j["channelsUsed"]    = plan.channels_used();
  j["reason"]          = plan.reason;
  return j;
}

json to_json(const Transfer& t) {
  json j;
  j["id"]               = t.id;
  j["destinationId"]    = t.destination_id;
  j["totalComponents"]  = t.total_components;
  j["sentComponents"]   = t.sent_components;
  j["failedComponents"] = t.failed_components;
  j["channelsUsed"]     = to_json(t.channels_used);
  j["status"]           = to_string(t.status);
  j["startedAt"]        = t.started_ms;
  j["completedAt"]      = t.completed_ms ? json(*t.completed_ms) : json(nullptr);
  j["reason"]           = t.reason;
  return j;
}

json to_json(const PresenceBeacon& b) {
  json j;
  j["nodeId"]          = b.node_id;
  j["timestamp"]       = b.timestamp_ms;
  j["activeChannels"]  = to_json(b.active_channels);
  j["relayCapable"]    = b.relay_capable;
  j["pendingCount"]    = b.pending_count;
  j["protocolVersion"] = b.protocol_version;
  return j;
}

json to_json(const MetricsSnapshot& m) {
  json j;
  j["transmissions"]      = m.transmissions;
  j["receptions"]         = m.receptions;
  j["relayed"]            = m.relayed;
  j["storeForward"]       = m.store_forward;
  j["bytesSent"]          = m.bytes_sent;
  j["bytesReceived"]      = m.bytes_received;
  j["failovers"]          = m.failovers;
  j["peersDiscovered"]    = m.peers_discovered;
  j["peersSwept"]         = m.peers_swept;
  j["transfersCompleted"] = m.transfers_completed;
  j["transfersFailed"]    = m.transfers_failed;
  j["expired"]            = m.expired;
  j["dropped"]            = m.dropped;
  j["integrityFailures"]  = m.integrity_failures;
  j["framesEncoded"]      = m.frames_encoded;
  j["framesDecoded"]      = m.frames_decoded;
  j["crcErrors"]          = m.crc_errors;
  j["deduplicated"]       = m.deduplicated;
  j["gossipBroadcasts"]   = m.gossip_broadcasts;
  j["gossipSuppressed"]   = m.gossip_suppressed;
  j["beaconsEmitted"]     = m.beacons_emitted;
  j["ticks"]              = m.ticks;

  json per = json::object();
  for (size_t i = 0; i < transport::CHANNEL_COUNT; ++i) {
    const auto& c = m.channels[i];
    if (c.sent == 0 && c.received == 0 && c.relayed == 0 && c.errors == 0) continue;
    per[transport::to_string(static_cast<Channel>(i))] = {
      {"sent", c.sent}, {"received", c.received}, {"relayed", c.relayed},
      {"bytes", c.bytes}, {"errors", c.errors}
    };
  }
  j["channels"] = per;
  return j;
}

// ---------- runtime results ----------

json to_json(const SendResult& r) {
  json j;
  j["ok"]             = r.ok;
  j["error"]          = error_or_null(r.error);
  j["mode"]           = to_string(r.mode);
  j["packetId"]       = r.packet_id;
  j["channel"]        = channel_or_null(r.channel);
  j["packetCount"]    = r.packet_count;
  j["totalBytes"]     = r.total_bytes;
  j["alternates"]     = to_json(r.alternates);
  j["reason"]         = r.reason;
  if (!r.transmission_id.empty()) j["transmissionId"] = r.transmission_id;
  if (!r.relay_id.empty())        j["relayId"] = r.relay_id;
  return j;
}

json to_json(const ReceiveResult& r) {
  json j;
  j["ok"]           = r.ok;
  j["error"]        = error_or_null(r.error);
  j["verified"]     = r.verified;
  j["packetId"]     = r.packet_id;
  j["expectedHash"] = r.expected_hash;
  j["actualHash"]   = r.actual_hash;
  if (r.ok) j["unit"] = r.unit;
  return j;
}

json to_json(const FrameAcceptResult& r) {
  json j;
  j["ok"]        = r.ok;
  j["error"]     = error_or_null(r.error);
  j["duplicate"] = r.duplicate;
  j["gossip"]    = r.gossip;
  if (r.ok) {
    j["frame"] = to_json(r.frame);
    j["unit"]  = r.unit;
  }
  return j;
}

json to_json(const TransmissionRecord& rec) {
  json j;
  j["id"]            = rec.id;
  j["packetId"]      = rec.packet_id;
  j["destinationId"] = rec.destination_id;
  j["channel"]       = transport::to_string(rec.channel);
  j["mode"]          = to_string(rec.mode);
  j["packetCount"]   = rec.packet_count;
  j["totalBytes"]    = rec.total_bytes;
  j["timestamp"]     = rec.timestamp_ms;
  return j;
}

json to_json(const HeartbeatReport& r) {
  json j;
  j["tick"]            = r.tick;
  j["drain"]           = to_json(r.drain);
  j["beaconEmitted"]   = r.beacon_emitted;
  j["swept"]           = r.swept;
  j["peersSwept"]      = r.peers_swept;
  j["transfersPruned"] = r.transfers_pruned;
  j["hashesPruned"]    = r.hashes_pruned;
  return j;
}

json to_json(const OfflineSyncPlan& p) {
  json j;
  j["ok"]       = p.ok;
  j["online"]   = p.online;
  j["outbound"] = p.outbound;
  j["queued"]   = p.queued;
  j["channel"]  = channel_or_null(p.channel);
  j["reason"]   = p.reason;
  return j;
}

// ---------- files ----------

json read_json_file(const fs::path& file) {
  std::error_code ec;
  if (!fs::exists(file, ec) || ec) return json::object();

  std::ifstream in(file);
  if (!in) {
    log::warn("codec", "cannot open " + file.string());
    return json::object();
  }
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    log::warn("codec", "malformed JSON in " + file.string() + "; ignoring");
    return json::object();
  }
  return j;
}

bool atomic_write_json(const fs::path& file, const json& j) {
  std::error_code ec;
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
      log::error("codec", "cannot create " + file.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  auto tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      log::error("codec", "cannot write " + tmp.string());
      return false;
    }
    out << j.dump(2, ' ', false, json::error_handler_t::replace);
    out.flush();
    if (!out) {
      log::error("codec", "short write to " + tmp.string());
      return false;
    }
  }

  fs::rename(tmp, file, ec);
  if (ec) {
    log::error("codec", "rename " + tmp.string() + " failed: " + ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace codec
} // namespace meshrelay
