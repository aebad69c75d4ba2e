/**
 * @file json_codec.hpp
 * @brief JSON views of mesh records, plus the small file helpers around them.
 *
 * @details
 * Every record the runtime returns has a JSON form here. The CLI prints
 * them, the peer directory and config persist them, and tests compare them.
 * Keys are camelCase to match the config file.
 *
 * ## Parsing
 * The `*_from_json` readers are tolerant: missing keys take defaults, a key
 * of the wrong type makes the whole record invalid (`std::nullopt`), and
 * nothing throws.
 *
 * ## Files
 * - `read_json_file()` returns `{}` for a missing file, and `{}` plus a
 *   warning for unreadable or malformed JSON.
 * - `atomic_write_json()` writes `<file>.tmp` then renames over the target,
 *   so a reader never sees half a file.
 */
#ifndef MESHRELAY_JSON_CODEC_HPP
#define MESHRELAY_JSON_CODEC_HPP

#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "meshrelay/fragmenter.hpp"
#include "meshrelay/frame_codec.hpp"
#include "meshrelay/metrics.hpp"
#include "meshrelay/multipath.hpp"
#include "meshrelay/node_identity.hpp"
#include "meshrelay/packet.hpp"
#include "meshrelay/peer_directory.hpp"
#include "meshrelay/relay_queue.hpp"
#include "meshrelay/router.hpp"
#include "meshrelay/runtime.hpp"
#include "meshrelay/transport/transport_registry.hpp"

namespace meshrelay {
namespace codec {

using json = nlohmann::json;

// ---------- channels ----------
json to_json(const transport::ChannelSet& set);
json to_json(const std::vector<transport::ChannelStatus>& report);
/// Array of channel keys; unknown keys or non-strings → std::nullopt.
std::optional<transport::ChannelSet> channels_from_json(const json& j);

// ---------- records ----------
json to_json(const Peer& peer);
std::optional<Peer> peer_from_json(const json& j);
json to_json(const Topology& topo);

json to_json(const MeshHeader& header);
json to_json(const Packet& packet);
std::optional<Packet> packet_from_json(const json& j);

json to_json(const Fragment& frag);
std::optional<Fragment> fragment_from_json(const json& j);

json to_json(const Frame& frame);
json to_json(const FrameDecodeResult& r);

json to_json(const RouteDecision& d);
json to_json(const RelayConfig& cfg);
json to_json(const RelayEntry& e);
json to_json(const EnqueueResult& r);
json to_json(const DrainReport& r);
json to_json(const MultiPathPlan& plan);
json to_json(const Transfer& t);
json to_json(const PresenceBeacon& b);
json to_json(const MetricsSnapshot& m);

// ---------- runtime results ----------
json to_json(const SendResult& r);
json to_json(const ReceiveResult& r);
json to_json(const FrameAcceptResult& r);
json to_json(const TransmissionRecord& rec);
json to_json(const HeartbeatReport& r);
json to_json(const OfflineSyncPlan& p);

// ---------- files ----------
json read_json_file(const std::filesystem::path& file);
bool atomic_write_json(const std::filesystem::path& file, const json& j);

} // namespace codec
} // namespace meshrelay

#endif // MESHRELAY_JSON_CODEC_HPP
