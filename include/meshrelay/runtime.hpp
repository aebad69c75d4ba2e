/**
 * @file runtime.hpp
 * @brief MeshRuntime: one mesh node: send, receive, relay, heartbeat.
 *
 * @details
 * ## Field Brief
 * The runtime is the node brain. It owns every piece of mutable mesh state:
 * the channel registry, the node identity, the peer directory, the relay
 * queue, the dedup set, transfers, the transmission log and the counters.
 * Nothing is global. Two runtimes in one process are two independent nodes,
 * which is exactly what the tests do.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  send(unit, dest)
 *    │ build_packet ──► select_route ──┬─ channel ──► [fragment] ──► transmit ──► tx log
 *    │                                 │                               │ refused on all
 *    │                                 └─ none ────────────────────────┴──► relay queue
 *    │
 *  receive(packet) ── verify hash ──► unit sink (persistence collaborator)
 *  accept_frame(bytes) ── decode ── dedup ── gossip decision
 *
 *  tick(now_ms)
 *    ├─ every tick:  drain relay queue (expire, deliver to reachable peers)
 *    ├─ every 10th:  presence beacon → beacon sink
 *    └─ every 50th:  sweep stale peers, prune old transfers and hashes
 * ```
 *
 * ---
 *
 * @par Failure Model
 * - No operation throws. Per-item failures come back as `{ok:false, error}`.
 * - "No live channel" is not a failure: `send()` parks the packet and
 *   returns `ok` with `mode == StoreForward`.
 * - A collaborator (sink, transmitter) that throws is logged and treated as
 *   a refusal; it never unwinds through `tick()`.
 * - A parked send whose queue refused it (relay disabled, queue full) is
 *   still `ok`; `relay_id` stays empty and `error` says why.
 *
 * ---
 *
 * @par Concurrency
 * Each owned resource has its own lock (see the component headers). The
 * runtime adds locks only for transfers, the transmission log and the last
 * beacon. Foreground calls and a background `tick()` may run concurrently.
 * The transmitter runs under the relay queue lock during a drain, so it must
 * not call back into `send()`, `enqueue()` or `drain()`.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * meshrelay::MeshRuntime node;                       // default probe: internet
 * auto r = node.send({{"type", "NOTE"}, {"body", "hi"}}, "node_remote");
 * if (r.ok && r.mode == meshrelay::RouteMode::StoreForward) {
 *   // parked; the heartbeat will retry
 * }
 * node.tick(now_ms);
 * @endcode
 */
#ifndef MESHRELAY_RUNTIME_HPP
#define MESHRELAY_RUNTIME_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "etl/circular_buffer.h"

#include "meshrelay/config.hpp"
#include "meshrelay/data_unit.hpp"
#include "meshrelay/error.hpp"
#include "meshrelay/fragmenter.hpp"
#include "meshrelay/frame_codec.hpp"
#include "meshrelay/metrics.hpp"
#include "meshrelay/multipath.hpp"
#include "meshrelay/node_identity.hpp"
#include "meshrelay/packet.hpp"
#include "meshrelay/peer_directory.hpp"
#include "meshrelay/relay_queue.hpp"
#include "meshrelay/router.hpp"
#include "meshrelay/seen_set.hpp"
#include "meshrelay/transport/transport_registry.hpp"

namespace meshrelay {

/**
 * @brief Persistence collaborator: receives every verified unit.
 */
class IUnitSink {
public:
  virtual ~IUnitSink() = default;
  virtual void store(const std::string& packet_id, const std::string& payload_hash,
                     const DataUnit& unit) = 0;
};

/**
 * @brief Where presence beacons go (a broadcast transport, a log, a test).
 */
class IBeaconSink {
public:
  virtual ~IBeaconSink() = default;
  virtual void emit(const PresenceBeacon& beacon) = 0;
};

using Clock = std::function<uint64_t()>;

/// Put one packet on a channel. False = refused, try elsewhere or later.
using Transmitter = std::function<bool(const Packet& packet, transport::Channel ch)>;

/// Wall clock in milliseconds since the epoch.
uint64_t system_now_ms();

struct RuntimeOptions {
  MeshConfig                                config;
  std::shared_ptr<transport::IChannelProbe> probe;        ///< null → from config, else default
  Clock                                     clock;        ///< null → system_now_ms
  std::shared_ptr<IUnitSink>                unit_sink;
  std::shared_ptr<IBeaconSink>              beacon_sink;
  Transmitter                               transmitter;  ///< null → every send succeeds
};

struct SendOptions {
  Proximity                 proximity{Proximity::None};
  std::optional<RelayClass> priority_class;
  std::optional<Urgency>    urgency;
  std::optional<int>        ttl;
  std::optional<int64_t>    hold_time_ms;     ///< only used if the packet is parked
};

struct SendResult {
  bool                              ok{false};
  MeshError                         error{MeshError::None};
  RouteMode                         mode{RouteMode::StoreForward};
  std::string                       packet_id;
  std::string                       transmission_id;   ///< tx_… when sent
  std::optional<transport::Channel> channel;
  size_t                            packet_count{0};
  size_t                            total_bytes{0};
  std::string                       relay_id;          ///< relay_… when parked
  transport::ChannelSet             alternates;
  std::string                       reason;
};

struct ReceiveResult {
  bool        ok{false};
  MeshError   error{MeshError::None};
  bool        verified{false};
  std::string packet_id;
  std::string expected_hash;
  std::string actual_hash;
  DataUnit    unit;
};

struct FrameAcceptResult {
  bool      ok{false};
  MeshError error{MeshError::None};
  bool      duplicate{false};
  bool      gossip{false};
  Frame     frame;
  DataUnit  unit;
};

struct TransmissionRecord {
  std::string        id;
  std::string        packet_id;
  std::string        destination_id;
  transport::Channel channel{transport::Channel::Internet};
  RouteMode          mode{RouteMode::Direct};
  size_t             packet_count{0};
  size_t             total_bytes{0};
  uint64_t           timestamp_ms{0};
};

struct HeartbeatReport {
  uint64_t    tick{0};
  DrainReport drain;
  bool        beacon_emitted{false};
  bool        swept{false};
  size_t      peers_swept{0};
  size_t      transfers_pruned{0};
  size_t      hashes_pruned{0};
};

struct OfflineSyncPlan {
  bool                              ok{false};
  bool                              online{false};
  size_t                            outbound{0};   ///< sent now
  size_t                            queued{0};     ///< parked for later
  std::optional<transport::Channel> channel;
  std::string                       reason;
};

class MeshRuntime {
public:
  MeshRuntime();
  explicit MeshRuntime(RuntimeOptions options);

  MeshRuntime(const MeshRuntime&) = delete;
  MeshRuntime& operator=(const MeshRuntime&) = delete;

  // ---------- identity ----------
  const std::string& self_id() const;
  PresenceBeacon presence_beacon() const;
  std::optional<PresenceBeacon> last_beacon() const;

  // ---------- components ----------
  transport::TransportRegistry& transports() { return transports_; }
  const transport::TransportRegistry& transports() const { return transports_; }
  PeerDirectory& peers() { return peers_; }
  const PeerDirectory& peers() const { return peers_; }
  RelayQueue& relay_queue() { return queue_; }
  const RelayQueue& relay_queue() const { return queue_; }
  SeenSet& seen() { return seen_; }
  const MeshConfig& config() const { return config_; }

  // ---------- building blocks, stamped with this node's id and clock ----------
  std::optional<Packet> build_packet(const DataUnit& unit, std::string_view destination_id,
                                     PacketOptions options = {}) const;
  RouteDecision select_route(size_t payload_bytes, const RouteOptions& options = {}) const;
  std::optional<Frame> encode_frame(const DataUnit& unit, FrameOptions options = {});
  FrameDecodeResult decode_frame(const uint8_t* data, size_t len);

  /// Decode, dedup by payload hash, decide on gossip. Duplicates are ok but flagged.
  FrameAcceptResult accept_frame(const uint8_t* data, size_t len, double novelty = 1.0);

  // ---------- peers ----------
  std::optional<Peer> register_peer(const PeerInfo* info);
  std::optional<Peer> register_peer(const PeerInfo& info);
  bool remove_peer(const std::string& node_id);
  Topology topology() const;

  // ---------- relay ----------
  EnqueueResult enqueue(const Packet* packet, std::string_view destination_id,
                        const EnqueueOptions& options = {});
  RelayConfig configure_relay(const RelayConfigUpdate& update);
  DrainReport drain();
  DrainReport drain(uint64_t now_ms);

  // ---------- pipeline ----------
  SendResult send(const DataUnit& unit, std::string_view destination_id,
                  const SendOptions& options = {});
  ReceiveResult receive(const Packet* packet);
  ReceiveResult receive(const Packet& packet) { return receive(&packet); }
  ReceiveResult receive_fragments(const FragmentList& fragments);

  // ---------- transfers ----------
  MultiPathPlan plan_multi_path(const std::vector<DataUnit>& components) const;
  Transfer initiate_transfer(const std::vector<DataUnit>& components, std::string_view destination_id,
                             const SendOptions& options = {});
  std::optional<Transfer> transfer(const std::string& transfer_id) const;
  std::vector<Transfer> transfers() const;

  OfflineSyncPlan plan_offline_sync(const std::vector<DataUnit>& outbound);

  // ---------- heartbeat ----------
  HeartbeatReport tick();
  HeartbeatReport tick(uint64_t now_ms);

  // ---------- metrics & logs ----------
  MetricsSnapshot metrics() const;
  /// Newest first; `limit == 0` means all retained.
  std::vector<TransmissionRecord> transmissions(size_t limit = 0) const;

  /// Persist the peer roster if a peers file is configured.
  bool save_state() const;

  uint64_t now() const { return clock_(); }

private:
  std::optional<transport::Channel> reach(const std::string& destination_id) const;
  bool transmit(const Packet& packet, transport::Channel ch);
  std::optional<TransmissionRecord> send_on(const DataUnit& unit, const Packet& packet, transport::Channel ch);
  std::vector<Packet> fragment_packets(const DataUnit& unit, const Packet& whole, transport::Channel ch) const;
  void park(const Packet& packet, const SendOptions& options, SendResult& r);
  void log_transmission(const TransmissionRecord& rec);
  size_t prune_transfers(uint64_t now_ms);

  MeshConfig                   config_;
  Clock                        clock_;
  NodeIdentity                 identity_;
  transport::TransportRegistry transports_;
  PeerDirectory                peers_;
  RelayQueue                   queue_;
  SeenSet                      seen_;
  Metrics                      metrics_;
  std::shared_ptr<IUnitSink>   unit_sink_;
  std::shared_ptr<IBeaconSink> beacon_sink_;
  Transmitter                  transmitter_;

  std::atomic<uint64_t>        tick_count_{0};

  mutable std::mutex           transfers_mu_;
  std::map<std::string, Transfer> transfers_;

  mutable std::mutex           tx_mu_;
  etl::circular_buffer<TransmissionRecord, TX_LOG_CAP> tx_log_;

  mutable std::mutex           beacon_mu_;
  std::optional<PresenceBeacon> last_beacon_;
};

} // namespace meshrelay

#endif // MESHRELAY_RUNTIME_HPP
