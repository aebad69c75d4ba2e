// -----------------------------------------------------------------------------
// runtime.cpp: Implementation of MeshRuntime
//
// API & field descriptions:
//   see include/meshrelay/runtime.hpp
//
// Runnable examples & usage tests:
//   see tests/test_runtime.cpp
//
// NOTE: This file holds the composition policy: which component runs when,
// which counters move, and what happens when a collaborator refuses.
// Component rules (routing scores, queue order, dedup) live in their own
// sources.
// -----------------------------------------------------------------------------
#include "meshrelay/runtime.hpp"

#include "meshrelay/digest.hpp"
#include "meshrelay/json_codec.hpp"
#include "meshrelay/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace meshrelay {

using transport::Channel;
using transport::ChannelSet;

namespace {

std::shared_ptr<transport::IChannelProbe> choose_probe(std::shared_ptr<transport::IChannelProbe> given,
                                                       const MeshConfig& cfg) {
  if (given) return given;
  if (cfg.channels) return std::make_shared<transport::StaticProbe>(*cfg.channels);
  return std::make_shared<transport::DefaultProbe>();
}

bool is_broadcast(const std::string& id) {
  return id.empty() || id == BROADCAST;
}

// Room left for the escaped chunk in one fragment packet on `ch`: the
// channel limit less the packet envelope and the record wrapped around the
// chunk. Index and total are sized at their widest.
size_t fragment_chunk_room(Channel ch) {
  Fragment shell;
  shell.transfer_id = make_id("xfer");
  shell.index       = static_cast<uint32_t>(FRAGMENT_TOTAL_MAX);
  shell.total       = static_cast<uint32_t>(FRAGMENT_TOTAL_MAX);
  shell.chunk_hash  = std::string(FRAGMENT_HASH_HEX, '0');
  const size_t used = PACKET_OVERHEAD + canonical(codec::to_json(shell)).size();
  const size_t max  = transport::profile(ch).max_payload_bytes;
  return max > used ? max - used : 0;
}

} // namespace

uint64_t system_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// ---------- public ----------

MeshRuntime::MeshRuntime() : MeshRuntime(RuntimeOptions{}) {}

MeshRuntime::MeshRuntime(RuntimeOptions options)
: config_(std::move(options.config)),
  clock_(options.clock ? std::move(options.clock) : Clock(system_now_ms)),
  identity_(config_.node_id),
  transports_(choose_probe(std::move(options.probe), config_)),
  peers_(identity_.self_id()),
  queue_(config_.relay),
  unit_sink_(std::move(options.unit_sink)),
  beacon_sink_(std::move(options.beacon_sink)),
  transmitter_(std::move(options.transmitter)) {
  if (!config_.peers_file.empty()) {
    const size_t n = peers_.load(config_.peers_file);
    if (n > 0) log::info("runtime", "restored " + std::to_string(n) + " peers");
  }
}

const std::string& MeshRuntime::self_id() const {
  return identity_.self_id();
}

PresenceBeacon MeshRuntime::presence_beacon() const {
  return identity_.presence_beacon(now(), transports_.available_channels(),
                                   queue_.config().enabled, queue_.size());
}

std::optional<PresenceBeacon> MeshRuntime::last_beacon() const {
  std::lock_guard<std::mutex> lock(beacon_mu_);
  return last_beacon_;
}

std::optional<Packet> MeshRuntime::build_packet(const DataUnit& unit, std::string_view destination_id,
                                                PacketOptions options) const {
  if (options.source_id.empty()) options.source_id = self_id();
  if (options.created_ms == 0) options.created_ms = now();
  return meshrelay::build_packet(unit, destination_id, options);
}

RouteDecision MeshRuntime::select_route(size_t payload_bytes, const RouteOptions& options) const {
  return meshrelay::select_route(payload_bytes, options, transports_);
}

std::optional<Frame> MeshRuntime::encode_frame(const DataUnit& unit, FrameOptions options) {
  if (options.source_node.empty()) options.source_node = self_id();
  auto frame = meshrelay::encode_frame(unit, options);
  if (frame) ++metrics_.frames_encoded;
  return frame;
}

FrameDecodeResult MeshRuntime::decode_frame(const uint8_t* data, size_t len) {
  FrameDecodeResult r = meshrelay::decode_frame(data, len);
  if (r.ok) {
    ++metrics_.frames_decoded;
  } else if (r.error == MeshError::CrcMismatch) {
    ++metrics_.crc_errors;
  }
  return r;
}

/*
 * accept_frame()
 * --------------
 * Inbound gate for frames off any channel.
 *   1) decode (magic, version, CRC, payload)
 *   2) dedup on the SHA-256 of the payload bytes, atomically
 *   3) first sighting only: gossip decision
 */
FrameAcceptResult MeshRuntime::accept_frame(const uint8_t* data, size_t len, double novelty) {
  FrameAcceptResult out;
  FrameDecodeResult d = decode_frame(data, len);
  if (!d.ok) {
    out.error = d.error;
    return out;
  }

  out.ok    = true;
  out.frame = std::move(d.frame);
  out.unit  = std::move(d.unit);

  const std::string hash = sha256_hex(out.frame.payload);
  out.duplicate = seen_.check_and_mark(hash, now());
  if (out.duplicate) {
    log::debug("runtime", "duplicate frame " + hash.substr(0, 16));
    return out;
  }
  out.gossip = seen_.should_gossip(&out.frame, novelty);
  return out;
}

std::optional<Peer> MeshRuntime::register_peer(const PeerInfo* info) {
  bool created = false;
  auto p = peers_.register_peer(info, now(), &created);
  if (created) ++metrics_.peers_discovered;
  return p;
}

std::optional<Peer> MeshRuntime::register_peer(const PeerInfo& info) {
  return register_peer(&info);
}

bool MeshRuntime::remove_peer(const std::string& node_id) {
  return peers_.remove_peer(node_id);
}

Topology MeshRuntime::topology() const {
  return peers_.topology(transports_.available_channels());
}

EnqueueResult MeshRuntime::enqueue(const Packet* packet, std::string_view destination_id,
                                   const EnqueueOptions& options) {
  EnqueueResult r = queue_.enqueue(packet, destination_id, options, now());
  if (r.queued) {
    ++metrics_.store_forward;
    if (!r.evicted_id.empty()) ++metrics_.dropped;
  } else if (r.error != MeshError::MissingRequiredInput) {
    ++metrics_.dropped;
  }
  return r;
}

RelayConfig MeshRuntime::configure_relay(const RelayConfigUpdate& update) {
  return queue_.configure(update);
}

DrainReport MeshRuntime::drain() {
  return drain(now());
}

// -----------------------------------------------------------------------------
// drain()
// POLICY: reachable = known peer sharing a usable channel, or broadcast with
//         any usable channel. Delivery goes through the transmitter.
// OUT:    queue report; expired and failed entries are folded into metrics.
// -----------------------------------------------------------------------------
DrainReport MeshRuntime::drain(uint64_t now_ms) {
  auto reachable = [this](const std::string& destination_id) { return reach(destination_id); };
  auto delivery = [this](const RelayEntry& e, Channel ch) {
    if (!transmit(e.packet, ch)) {
      metrics_.channel_error(ch);
      return false;
    }
    ++metrics_.relayed;
    metrics_.bytes_sent += e.packet.total_bytes();
    metrics_.channel_relayed(ch);
    peers_.record_transmission(e.destination_id);
    return true;
  };

  DrainReport rep = queue_.drain(now_ms, reachable, delivery);
  metrics_.expired += rep.expired;
  metrics_.dropped += rep.failed;
  if (rep.delivered || rep.expired || rep.failed) {
    log::debug("runtime", "drain delivered=" + std::to_string(rep.delivered) +
                          " expired=" + std::to_string(rep.expired) +
                          " remaining=" + std::to_string(rep.remaining));
  }
  return rep;
}

// -----------------------------------------------------------------------------
// send()
// PRE:    unit not null.
// POLICY:
//   - Route on payload size. No channel → park in the relay queue, still ok.
//   - Try the chosen channel, then the alternates. A refusal on the first
//     choice counts one failover. All refused → park.
// OUT:    ok + transmission id, or ok + relay id (store-forward).
// -----------------------------------------------------------------------------
SendResult MeshRuntime::send(const DataUnit& unit, std::string_view destination_id,
                             const SendOptions& options) {
  SendResult r;
  if (unit.is_null()) {
    r.error  = MeshError::MissingRequiredInput;
    r.reason = "no_unit_provided";
    return r;
  }

  PacketOptions po;
  po.priority_class = options.priority_class;
  po.urgency        = options.urgency;
  po.ttl            = options.ttl;
  auto packet = build_packet(unit, destination_id, po);
  if (!packet) {
    r.error = MeshError::MissingRequiredInput;
    return r;
  }
  r.packet_id = packet->id;

  RouteOptions ro;
  ro.proximity      = options.proximity;
  ro.priority_class = packet->priority_class ? packet->priority_class
                                             : std::optional<RelayClass>(relay_class_for(packet->urgency));
  const RouteDecision route = select_route(packet->payload_bytes(), ro);
  r.alternates = route.alternates;

  if (!route.channel) {
    r.reason = route.reason;
    park(*packet, options, r);
    return r;
  }

  ChannelSet candidates;
  candidates.push_back(*route.channel);
  for (auto ch : route.alternates) transport::insert_unique(candidates, ch);

  for (size_t i = 0; i < candidates.size(); ++i) {
    const Channel ch = candidates[i];
    auto rec = send_on(unit, *packet, ch);
    if (!rec) {
      if (i == 0) ++metrics_.failovers;
      log::warn("runtime", std::string("channel ") + transport::to_string(ch) + " refused " + packet->id);
      continue;
    }
    r.ok              = true;
    r.mode            = rec->mode;
    r.channel         = ch;
    r.transmission_id = rec->id;
    r.packet_count    = rec->packet_count;
    r.total_bytes     = rec->total_bytes;
    r.reason          = (i == 0) ? route.reason : std::string("failover_") + transport::to_string(ch);
    return r;
  }

  r.reason = "all_channels_refused";
  park(*packet, options, r);
  return r;
}

// -----------------------------------------------------------------------------
// receive()
// PRE:    packet not null.
// POLICY: hash mismatch is tamper or corruption; the unit is never handed on.
//         A sink that throws is logged; the packet still counts as received.
// -----------------------------------------------------------------------------
ReceiveResult MeshRuntime::receive(const Packet* packet) {
  ReceiveResult r;
  if (!packet) {
    r.error = MeshError::MissingRequiredInput;
    return r;
  }

  r.packet_id     = packet->id;
  r.expected_hash = packet->payload_hash;
  r.actual_hash   = sha256_hex(packet->payload);
  if (r.actual_hash != r.expected_hash) {
    ++metrics_.integrity_failures;
    r.error = MeshError::IntegrityCheckFailed;
    log::warn("runtime", "integrity check failed for " + packet->id);
    return r;
  }

  auto unit = packet->unit();
  if (!unit) {
    r.error = MeshError::MalformedPayload;
    return r;
  }

  r.ok       = true;
  r.verified = true;
  r.unit     = std::move(*unit);

  ++metrics_.receptions;
  metrics_.bytes_received += packet->total_bytes();
  if (packet->channel) metrics_.channel_received(*packet->channel, packet->total_bytes());

  if (unit_sink_) {
    try {
      unit_sink_->store(packet->id, r.actual_hash, r.unit);
    } catch (const std::exception& e) {
      log::error("runtime", std::string("unit sink failed: ") + e.what());
    }
  }
  return r;
}

ReceiveResult MeshRuntime::receive_fragments(const FragmentList& fragments) {
  ReceiveResult r;
  if (fragments.empty()) {
    r.error = MeshError::MissingRequiredInput;
    return r;
  }
  r.packet_id = fragments.front().transfer_id;

  auto unit = reassemble(fragments);
  if (!unit) {
    ++metrics_.integrity_failures;
    r.error = MeshError::IntegrityCheckFailed;
    log::warn("runtime", "fragment set " + r.packet_id + " did not reassemble");
    return r;
  }

  const std::string bytes = canonical(*unit);
  r.ok            = true;
  r.verified      = true;
  r.actual_hash   = sha256_hex(bytes);
  r.expected_hash = r.actual_hash;
  r.unit          = std::move(*unit);

  ++metrics_.receptions;
  metrics_.bytes_received += bytes.size() + fragments.size() * PACKET_OVERHEAD;

  if (unit_sink_) {
    try {
      unit_sink_->store(r.packet_id, r.actual_hash, r.unit);
    } catch (const std::exception& e) {
      log::error("runtime", std::string("unit sink failed: ") + e.what());
    }
  }
  return r;
}

MultiPathPlan MeshRuntime::plan_multi_path(const std::vector<DataUnit>& components) const {
  return meshrelay::plan_multi_path(components, transports_.available_channels());
}

/*
 * initiate_transfer()
 * -------------------
 * Plan, then push every component through send() with the consciousness
 * class. A parked component counts as sent: it will go out with the relay
 * queue. Status: all sent → completed, none → failed, else partial.
 */
Transfer MeshRuntime::initiate_transfer(const std::vector<DataUnit>& components,
                                        std::string_view destination_id, const SendOptions& options) {
  Transfer t;
  t.id               = make_id("xfer");
  t.destination_id   = destination_id.empty() ? std::string(BROADCAST) : std::string(destination_id);
  t.total_components = components.size();
  t.started_ms       = now();
  t.status           = TransferStatus::InProgress;

  const MultiPathPlan plan = plan_multi_path(components);
  if (plan.ok) {
    SendOptions so = options;
    so.priority_class = options.priority_class.value_or(RelayClass::Consciousness);
    for (const auto& path : plan.paths) {
      transport::insert_unique(t.channels_used, path.channel);
      for (const auto& component : path.components) {
        const SendResult sr = send(component, t.destination_id, so);
        if (sr.ok) ++t.sent_components;
        else       ++t.failed_components;
      }
    }
    t.reason = plan.reason;
  } else {
    t.failed_components = components.size();
    t.reason = to_string(plan.error);
  }

  if (t.total_components > 0 && t.sent_components == t.total_components) {
    t.status = TransferStatus::Completed;
    ++metrics_.transfers_completed;
  } else if (t.sent_components > 0) {
    t.status = TransferStatus::Partial;
  } else {
    t.status = TransferStatus::Failed;
    ++metrics_.transfers_failed;
  }
  t.completed_ms = now();

  std::lock_guard<std::mutex> lock(transfers_mu_);
  transfers_[t.id] = t;
  return t;
}

std::optional<Transfer> MeshRuntime::transfer(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(transfers_mu_);
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end()) return std::nullopt;
  return it->second;
}

std::vector<Transfer> MeshRuntime::transfers() const {
  std::lock_guard<std::mutex> lock(transfers_mu_);
  std::vector<Transfer> out;
  out.reserve(transfers_.size());
  for (const auto& kv : transfers_) out.push_back(kv.second);
  return out;
}

// -----------------------------------------------------------------------------
// plan_offline_sync()
// POLICY: every item is broadcast through send(). Offline, they all park;
//         online, they leave over the best usable channel.
// -----------------------------------------------------------------------------
OfflineSyncPlan MeshRuntime::plan_offline_sync(const std::vector<DataUnit>& outbound) {
  OfflineSyncPlan p;
  p.ok = true;

  const ChannelSet usable = transports_.available_channels();
  p.online = !usable.empty();
  if (p.online) p.channel = usable.front();
  p.reason = p.online ? std::string("sync_over_") + transport::to_string(usable.front())
                      : std::string("offline_queued_for_relay");

  for (const auto& unit : outbound) {
    const SendResult r = send(unit, BROADCAST);
    if (!r.ok) continue;
    if (r.mode == RouteMode::StoreForward) ++p.queued;
    else                                   ++p.outbound;
  }
  return p;
}

HeartbeatReport MeshRuntime::tick() {
  return tick(now());
}

// -----------------------------------------------------------------------------
// tick()
// POLICY:
//   - every tick:   drain the relay queue
//   - every 10th:   presence beacon (kept as last_beacon, handed to the sink)
//   - every 50th:   stale-peer sweep, old transfers, seen-hash pruning
// OUT:    what happened; never throws.
// -----------------------------------------------------------------------------
HeartbeatReport MeshRuntime::tick(uint64_t now_ms) {
  HeartbeatReport rep;
  rep.tick = ++tick_count_;
  ++metrics_.ticks;

  rep.drain = drain(now_ms);

  if (rep.tick % BEACON_EVERY_TICKS == 0) {
    PresenceBeacon beacon = identity_.presence_beacon(now_ms, transports_.available_channels(),
                                                      queue_.config().enabled, queue_.size());
    {
      std::lock_guard<std::mutex> lock(beacon_mu_);
      last_beacon_ = beacon;
    }
    ++metrics_.beacons_emitted;
    rep.beacon_emitted = true;
    if (beacon_sink_) {
      try {
        beacon_sink_->emit(beacon);
      } catch (const std::exception& e) {
        log::error("runtime", std::string("beacon sink failed: ") + e.what());
      }
    }
  }

  if (rep.tick % SWEEP_EVERY_TICKS == 0) {
    rep.swept            = true;
    rep.peers_swept      = peers_.sweep_stale(now_ms, config_.stale_peer_window_ms);
    rep.transfers_pruned = prune_transfers(now_ms);
    rep.hashes_pruned    = seen_.prune(now_ms);
    metrics_.peers_swept += rep.peers_swept;
  }
  return rep;
}

MetricsSnapshot MeshRuntime::metrics() const {
  return metrics_.snapshot(seen_.duplicates(), seen_.gossip_broadcasts(), seen_.gossip_suppressed());
}

std::vector<TransmissionRecord> MeshRuntime::transmissions(size_t limit) const {
  std::vector<TransmissionRecord> out;
  {
    std::lock_guard<std::mutex> lock(tx_mu_);
    out.reserve(tx_log_.size());
    for (const auto& rec : tx_log_) out.push_back(rec);
  }
  std::reverse(out.begin(), out.end());
  if (limit != 0 && out.size() > limit) out.resize(limit);
  return out;
}

bool MeshRuntime::save_state() const {
  if (config_.peers_file.empty()) return false;
  return peers_.save(config_.peers_file);
}

// ---------- private ----------

std::optional<Channel> MeshRuntime::reach(const std::string& destination_id) const {
  const ChannelSet usable = transports_.available_channels();   // best first
  if (usable.empty()) return std::nullopt;
  if (is_broadcast(destination_id)) return usable.front();

  auto peer = peers_.find(destination_id);
  if (!peer) return std::nullopt;
  for (auto ch : usable) {
    if (transport::contains(peer->channels, ch)) return ch;
  }
  return std::nullopt;
}

bool MeshRuntime::transmit(const Packet& packet, Channel ch) {
  if (!transmitter_) return true;
  try {
    return transmitter_(packet, ch);
  } catch (const std::exception& e) {
    log::error("runtime", std::string("transmitter failed on ") + transport::to_string(ch) + ": " + e.what());
    return false;
  }
}

// Put `packet` on `ch`, fragmenting first if it is too big for that channel.
// Any refused piece fails the whole attempt.
std::optional<TransmissionRecord> MeshRuntime::send_on(const DataUnit& unit, const Packet& packet, Channel ch) {
  const bool oversize = packet.payload_bytes() > transport::profile(ch).max_payload_bytes;

  std::vector<Packet> wire;
  if (oversize) {
    wire = fragment_packets(unit, packet, ch);
    if (wire.empty() || wire.size() > FRAGMENT_TOTAL_MAX) return std::nullopt;
  } else {
    wire.push_back(packet);
    wire.back().channel = ch;
  }

  size_t bytes = 0;
  for (const auto& p : wire) {
    if (!transmit(p, ch)) {
      metrics_.channel_error(ch);
      return std::nullopt;
    }
    bytes += p.total_bytes();
  }

  TransmissionRecord rec;
  rec.id             = make_id("tx");
  rec.packet_id      = packet.id;
  rec.destination_id = packet.destination_id;
  rec.channel        = ch;
  rec.mode           = oversize ? RouteMode::Fragmented : RouteMode::Direct;
  rec.packet_count   = wire.size();
  rec.total_bytes    = bytes;
  rec.timestamp_ms   = now();

  ++metrics_.transmissions;
  metrics_.bytes_sent += bytes;
  metrics_.channel_sent(ch, bytes);
  if (!is_broadcast(packet.destination_id)) peers_.record_transmission(packet.destination_id);
  log_transmission(rec);
  return rec;
}

// One packet per fragment. The fragment record (transfer id, index, total,
// chunk, chunk hash) is the packet payload; the header carries seq/total.
// Every packet fits the channel whole: total_bytes() <= max_payload_bytes.
std::vector<Packet> MeshRuntime::fragment_packets(const DataUnit& unit, const Packet& whole, Channel ch) const {
  std::vector<Packet> out;
  const size_t room = fragment_chunk_room(ch);
  if (room == 0) {
    log::warn("runtime", std::string("no room for fragments on ") + transport::to_string(ch));
    return out;
  }
  const FragmentList frags = fragment(unit, room, ChunkMeasure::JsonString);
  if (frags.size() > FRAGMENT_TOTAL_MAX) return out;
  out.reserve(frags.size());
  for (const auto& f : frags) {
    PacketOptions po;
    po.source_id      = whole.source_id;
    po.priority_class = whole.priority_class;
    po.urgency        = whole.urgency;
    po.ttl            = whole.header.ttl;
    po.sequence       = static_cast<int>(f.index);
    po.total          = static_cast<int>(f.total);
    po.created_ms     = whole.created_ms;
    auto p = meshrelay::build_packet(codec::to_json(f), whole.destination_id, po);
    if (!p) return {};
    if (p->total_bytes() > transport::profile(ch).max_payload_bytes) {
      log::warn("runtime", "fragment " + std::to_string(f.index) + " of " + f.transfer_id
                           + " does not fit " + transport::to_string(ch));
      return {};
    }
    p->channel = ch;
    out.push_back(std::move(*p));
  }
  return out;
}

void MeshRuntime::park(const Packet& packet, const SendOptions& options, SendResult& r) {
  EnqueueOptions eo;
  eo.hold_time_ms   = options.hold_time_ms;
  eo.priority_class = options.priority_class;

  const EnqueueResult q = enqueue(&packet, packet.destination_id, eo);
  r.ok           = true;
  r.mode         = RouteMode::StoreForward;
  r.channel      = std::nullopt;
  r.packet_count = 1;
  r.total_bytes  = packet.total_bytes();
  if (q.queued) {
    r.relay_id = q.relay_id;
  } else {
    r.error = q.error;
    log::warn("runtime", std::string("packet ") + packet.id + " not parked: " + to_string(q.error));
  }
}

void MeshRuntime::log_transmission(const TransmissionRecord& rec) {
  std::lock_guard<std::mutex> lock(tx_mu_);
  tx_log_.push(rec);      // full buffer overwrites the oldest
}

size_t MeshRuntime::prune_transfers(uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(transfers_mu_);
  size_t removed = 0;
  for (auto it = transfers_.begin(); it != transfers_.end();) {
    const auto& done = it->second.completed_ms;
    if (done && now_ms > *done && now_ms - *done > config_.transfer_retention_ms) {
      it = transfers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace meshrelay
