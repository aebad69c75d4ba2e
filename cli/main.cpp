/**
 * @file main.cpp
 * @brief meshctl: Linux one-shot runner around meshrelay::MeshRuntime.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into one runtime session.
 *  - Ensure a node identity exists; persist under XDG config (~/.config/meshrelay).
 *  - Restore the peer roster and parked relay entries, run the requested
 *    operations, then write both back.
 *  - Print results as readable text (`--format pretty`) or one JSON document
 *    (`--format json`).
 *
 * Notes:
 *  - Channels come from the config file, or `--channels internet,bluetooth`
 *    (`--channels none` simulates a node with no live link).
 *  - Operations run in a fixed order: register/remove peer, send, route,
 *    frame encode/decode, ticks, then the read-only views.
 *  - State files: node.json {"id","last_time"}, peers.json, pending.json.
 */

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "meshrelay/config.hpp"
#include "meshrelay/digest.hpp"
#include "meshrelay/json_codec.hpp"
#include "meshrelay/log.hpp"
#include "meshrelay/runtime.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace meshrelay;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

// "internet,bluetooth" → set; "none" → empty set; unknown key → nullopt
static std::optional<transport::ChannelSet> parse_channel_list(const std::string& text) {
  transport::ChannelSet set;
  if (text == "none") return set;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) continue;
    auto ch = transport::channel_from_string(item);
    if (!ch) return std::nullopt;
    transport::insert_unique(set, *ch);
  }
  return set;
}

static std::optional<std::vector<uint8_t>> parse_hex(const std::string& text) {
  auto nib = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string digits;
  for (char c : text) if (c != ' ' && c != ':') digits.push_back(c);
  if (digits.size() % 2 != 0) return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    int hi = nib(digits[i]), lo = nib(digits[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

static std::string channel_text(const std::optional<transport::Channel>& ch) {
  return ch ? transport::to_string(*ch) : "-";
}

static std::string join_channels(const transport::ChannelSet& set) {
  if (set.empty()) return "(none)";
  std::string s;
  for (auto ch : set) {
    if (!s.empty()) s += ",";
    s += transport::to_string(ch);
  }
  return s;
}

// ---------- relay persistence ----------

// Parked entries survive between invocations; expiry is kept absolute.
static size_t restore_pending(MeshRuntime& rt, const fs::path& file) {
  const json j = codec::read_json_file(file);
  if (!j.is_array()) return 0;
  const int64_t now = static_cast<int64_t>(rt.now());
  size_t n = 0;
  for (const auto& rec : j) {
    if (!rec.is_object() || !rec.contains("packet")) continue;
    auto packet = codec::packet_from_json(rec["packet"]);
    if (!packet) continue;
    EnqueueOptions eo;
    if (rec.contains("expiresAt") && rec["expiresAt"].is_number_integer())
      eo.hold_time_ms = rec["expiresAt"].get<int64_t>() - now;
    if (rec.contains("priorityClass") && rec["priorityClass"].is_number_integer())
      eo.priority_class = relay_class_from_int(rec["priorityClass"].get<int>());
    std::string dest = BROADCAST;
    if (rec.contains("destinationId") && rec["destinationId"].is_string())
      dest = rec["destinationId"].get<std::string>();
    if (rt.enqueue(&*packet, dest, eo).queued) ++n;
  }
  return n;
}

static bool persist_pending(const MeshRuntime& rt, const fs::path& file) {
  json arr = json::array();
  for (const auto& e : rt.relay_queue().pending()) {
    json rec;
    rec["destinationId"] = e.destination_id;
    rec["priorityClass"] = static_cast<int>(e.priority_class);
    rec["expiresAt"]     = e.expires_at_ms;
    rec["packet"]        = codec::to_json(e.packet);
    arr.push_back(rec);
  }
  return codec::atomic_write_json(file, arr);
}

// ---------- pretty printers ----------

static void print_status(const MeshRuntime& rt, const Ansi& ansi) {
  std::cout << ansi.bold("NODE ") << rt.self_id() << "\n";
  std::cout << "  channels:\n";
  for (const auto& st : rt.transports().status_report()) {
    std::cout << "    " << std::left << std::setw(12) << st.profile->key
              << (st.available ? ansi.green("up  ") : ansi.dim("down"))
              << "  prio " << st.profile->priority
              << "  max " << st.profile->max_payload_bytes << " B"
              << "  " << ansi.dim(st.profile->protocol) << "\n";
  }
  const RelayConfig rc = rt.relay_queue().config();
  std::cout << "  relay: " << (rc.enabled ? "enabled" : "disabled")
            << "  queue " << rt.relay_queue().size() << "/" << rc.max_queue_size
            << "  hold " << rc.max_hold_time_ms << " ms\n";
}

static void print_topology(const Topology& t, const Ansi& ansi) {
  std::cout << ansi.bold("TOPOLOGY ") << t.total_nodes << " node(s), active: "
            << join_channels(t.active_channels) << "\n";
  std::cout << "  self  " << t.self_id << "\n";
  for (const auto& p : t.nodes) {
    std::cout << "  peer  " << std::left << std::setw(28) << p.node_id
              << join_channels(p.channels)
              << ansi.dim("  seen " + std::to_string(p.last_seen_ms)
                          + "  tx " + std::to_string(p.transmissions)) << "\n";
  }
}

static void print_pending(const std::vector<RelayEntry>& entries, const Ansi& ansi) {
  std::cout << ansi.bold("PENDING ") << entries.size() << " entr" << (entries.size() == 1 ? "y" : "ies") << "\n";
  for (const auto& e : entries) {
    std::cout << "  " << e.id << "  class " << static_cast<int>(e.priority_class)
              << " (" << to_string(e.priority_class) << ")  to " << e.destination_id
              << ansi.dim("  expires " + std::to_string(e.expires_at_ms)) << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  // CLI-centered options
  std::string opt_format = "pretty"; // pretty|json
  bool opt_no_color = false;
  std::string opt_state_dir;
  std::string opt_config;
  std::string opt_log_level;
  std::string opt_channels;
  uint64_t opt_now_ms = 0; // 0 => wall clock

  // Operations
  bool opt_status = false, opt_topology = false, opt_stats = false, opt_pending = false;
  std::string opt_register_peer, opt_peer_channels = "internet", opt_remove_peer;
  std::string opt_send, opt_to, opt_proximity = "none";
  int opt_priority_class = 0;
  int64_t opt_hold_ms = 0;
  size_t opt_route_bytes = 0;
  bool opt_route = false;
  unsigned opt_ticks = 0;
  std::string opt_encode, opt_decode;
  int opt_frame_priority = static_cast<int>(Urgency::General);

  CLI::App app{"meshctl: mesh relay node runner"};

  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--state-dir", opt_state_dir, "Override state directory");
  app.add_option("--config", opt_config, "Config file (default <state-dir>/config.json)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug","info","warn","error","off"}));
  app.add_option("--channels", opt_channels, "Usable channels, comma separated, or 'none'");
  app.add_option("--now-ms", opt_now_ms, "Pin the clock (ms since epoch)");

  app.add_flag("--status", opt_status, "Show node, channels and relay state");
  app.add_flag("--topology", opt_topology, "Show self and known peers");
  app.add_flag("--stats", opt_stats, "Show metrics and recent transmissions");
  app.add_flag("--pending", opt_pending, "List parked relay entries");

  app.add_option("--register-peer", opt_register_peer, "Register or refresh a peer id");
  app.add_option("--peer-channels", opt_peer_channels, "Channels for --register-peer")->capture_default_str();
  app.add_option("--remove-peer", opt_remove_peer, "Forget a peer id");

  app.add_option("--send", opt_send, "Send a JSON data unit");
  app.add_option("--to", opt_to, "Destination node id (default broadcast)");
  app.add_option("--priority-class", opt_priority_class, "Relay class 1 (threat) .. 5 (general)")
     ->check(CLI::Range(0, 5));
  app.add_option("--proximity", opt_proximity, "none|local|nearby")->check(CLI::IsMember({"none","local","nearby"}));
  app.add_option("--hold-ms", opt_hold_ms, "Hold time if the unit is parked");
  app.add_option("--route", opt_route_bytes, "Plan a route for a payload of N bytes");

  app.add_option("--ticks", opt_ticks, "Run N heartbeat ticks");
  app.add_option("--encode-frame", opt_encode, "Encode a JSON unit into a frame (hex out)");
  app.add_option("--frame-priority", opt_frame_priority, "Frame priority 0..7")->check(CLI::Range(0, 7));
  app.add_option("--decode-frame", opt_decode, "Decode a hex frame");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }
  opt_route = app.count("--route") > 0;

  // Prepare ANSI
  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");
  const bool as_json = (opt_format == "json");

  // Resolve state dir and config
  fs::path state_dir = opt_state_dir.empty() ? config::default_dir() : fs::path(opt_state_dir);
  std::error_code ec;
  fs::create_directories(state_dir, ec);
  if (ec) {
    std::cerr << ansi.red("error: cannot create " + state_dir.string() + ": " + ec.message()) << "\n";
    return 2;
  }

  fs::path config_file = opt_config.empty() ? state_dir / "config.json" : fs::path(opt_config);
  MeshConfig cfg = config::load(config_file);
  if (!opt_log_level.empty()) cfg.log_level = log::parse_level(opt_log_level, cfg.log_level);
  log::set_level(cfg.log_level);

  if (!opt_channels.empty()) {
    auto set = parse_channel_list(opt_channels);
    if (!set) {
      std::cerr << ansi.red("error: unknown channel in --channels") << "\n";
      return 2;
    }
    cfg.channels = *set;
  }

  // Decide node id: config wins, then the state file, else derive
  const fs::path node_file = state_dir / "node.json";
  uint64_t last_time = 0;
  {
    json st = codec::read_json_file(node_file);
    if (cfg.node_id.empty() && st.contains("id") && st["id"].is_string()) cfg.node_id = st["id"].get<std::string>();
    if (st.contains("last_time") && st["last_time"].is_number_unsigned()) last_time = st["last_time"].get<uint64_t>();
  }
  if (cfg.peers_file.empty()) cfg.peers_file = (state_dir / "peers.json").string();

  RuntimeOptions ro;
  ro.config = cfg;
  if (opt_now_ms != 0) ro.clock = [opt_now_ms] { return opt_now_ms; };
  MeshRuntime rt(std::move(ro));

  const fs::path pending_file = state_dir / "pending.json";
  restore_pending(rt, pending_file);

  json out = json::object();
  int exit_code = 0;

  if (!as_json) {
    const uint64_t now_sys = rt.now();
    const uint64_t delta = (last_time > 0 && now_sys >= last_time) ? (now_sys - last_time) : 0;
    std::cout << "ID: " << ansi.bold(rt.self_id())
              << "  state: " << state_dir.string()
              << "  " << ansi.dim("(+" + std::to_string(delta) + " ms since last run)") << "\n\n";
  }

  // ---------- peers ----------
  if (!opt_register_peer.empty()) {
    auto set = parse_channel_list(opt_peer_channels);
    if (!set) {
      std::cerr << ansi.red("error: unknown channel in --peer-channels") << "\n";
      return 2;
    }
    PeerInfo info;
    info.node_id = opt_register_peer;
    info.channels = *set;
    info.discovery_method = "manual";
    auto p = rt.register_peer(info);
    if (as_json) {
      out["registerPeer"] = p ? codec::to_json(*p) : json(nullptr);
    } else if (p) {
      std::cout << ansi.bold("PEER ") << p->node_id << " on " << join_channels(p->channels) << "\n";
    } else {
      std::cout << ansi.red("PEER rejected (empty or own id)") << "\n";
    }
    if (!p) exit_code = 1;
  }

  if (!opt_remove_peer.empty()) {
    const bool removed = rt.remove_peer(opt_remove_peer);
    if (as_json) out["removePeer"] = removed;
    else std::cout << ansi.bold("REMOVE ") << opt_remove_peer << (removed ? " ok" : " (unknown)") << "\n";
  }

  // ---------- send ----------
  if (!opt_send.empty()) {
    auto unit = parse_unit(opt_send);
    if (!unit) {
      std::cerr << ansi.red("error: --send expects a JSON value") << "\n";
      return 2;
    }
    SendOptions so;
    so.proximity = proximity_from_string(opt_proximity).value_or(Proximity::None);
    if (opt_priority_class > 0) so.priority_class = relay_class_from_int(opt_priority_class);
    if (app.count("--hold-ms")) so.hold_time_ms = opt_hold_ms;

    const SendResult r = rt.send(*unit, opt_to, so);
    if (as_json) {
      out["send"] = codec::to_json(r);
    } else {
      std::cout << ansi.bold("SEND ") << (r.ok ? ansi.green("ok") : ansi.red("failed"))
                << "  mode " << to_string(r.mode) << "  channel " << channel_text(r.channel)
                << "  " << r.packet_count << " packet(s), " << r.total_bytes << " B\n";
      if (!r.transmission_id.empty()) std::cout << "  tx    " << r.transmission_id << "\n";
      if (!r.relay_id.empty())        std::cout << "  relay " << r.relay_id << "\n";
      if (r.error != MeshError::None) std::cout << "  error " << to_string(r.error) << "\n";
      std::cout << "  " << ansi.dim(r.reason) << "\n";
    }
    if (!r.ok) exit_code = 1;
  }

  // ---------- route ----------
  if (opt_route) {
    RouteOptions route_opts;
    route_opts.proximity = proximity_from_string(opt_proximity).value_or(Proximity::None);
    if (opt_priority_class > 0) route_opts.priority_class = relay_class_from_int(opt_priority_class);
    const RouteDecision d = rt.select_route(opt_route_bytes, route_opts);
    if (as_json) {
      out["route"] = codec::to_json(d);
    } else {
      std::cout << ansi.bold("ROUTE ") << opt_route_bytes << " B → " << channel_text(d.channel)
                << "  mode " << to_string(d.mode);
      if (d.needs_fragmentation) std::cout << "  (" << d.fragment_count << " fragments)";
      std::cout << "  score " << d.score << "\n";
      std::cout << "  alternates " << join_channels(d.alternates) << "  " << ansi.dim(d.reason) << "\n";
    }
  }

  // ---------- frames ----------
  if (!opt_encode.empty()) {
    auto unit = parse_unit(opt_encode);
    if (!unit) {
      std::cerr << ansi.red("error: --encode-frame expects a JSON value") << "\n";
      return 2;
    }
    FrameOptions fo;
    fo.priority = opt_frame_priority;
    auto frame = rt.encode_frame(*unit, fo);
    if (!frame) {
      std::cerr << ansi.red("error: unit cannot be framed (null or too large)") << "\n";
      exit_code = 1;
    } else {
      const auto bytes = frame->pack();
      const std::string hex = to_hex(bytes.data(), bytes.size());
      if (as_json) {
        out["encodeFrame"] = {{"frame", codec::to_json(*frame)}, {"hex", hex}};
      } else {
        std::cout << ansi.bold("FRAME ") << frame->total_bytes() << " B  crc 0x"
                  << std::hex << std::setw(4) << std::setfill('0') << frame->crc
                  << std::dec << std::setfill(' ') << "\n  " << hex << "\n";
      }
    }
  }

  if (!opt_decode.empty()) {
    auto bytes = parse_hex(opt_decode);
    if (!bytes) {
      std::cerr << ansi.red("error: --decode-frame expects hex") << "\n";
      return 2;
    }
    const FrameAcceptResult r = rt.accept_frame(bytes->data(), bytes->size());
    if (as_json) {
      out["decodeFrame"] = codec::to_json(r);
    } else if (r.ok) {
      std::cout << ansi.bold("DECODE ") << ansi.green("ok") << "  priority " << static_cast<int>(r.frame.priority)
                << "  ttl " << static_cast<int>(r.frame.ttl)
                << "  gossip " << (r.gossip ? "yes" : "no") << "\n  " << r.unit.dump() << "\n";
    } else {
      std::cout << ansi.bold("DECODE ") << ansi.red(to_string(r.error)) << "\n";
    }
    if (!r.ok) exit_code = 1;
  }

  // ---------- heartbeat ----------
  if (opt_ticks > 0) {
    json reports = json::array();
    DrainReport total;
    for (unsigned i = 0; i < opt_ticks; ++i) {
      const HeartbeatReport hb = rt.tick();
      total.delivered += hb.drain.delivered;
      total.expired   += hb.drain.expired;
      total.failed    += hb.drain.failed;
      total.remaining  = hb.drain.remaining;
      if (as_json) reports.push_back(codec::to_json(hb));
    }
    if (as_json) {
      out["ticks"] = reports;
    } else {
      std::cout << ansi.bold("TICK x") << opt_ticks << "  delivered " << total.delivered
                << "  expired " << total.expired << "  failed " << total.failed
                << "  remaining " << total.remaining << "\n";
    }
  }

  // ---------- views ----------
  if (opt_status) {
    if (as_json) {
      out["status"] = {
        {"nodeId", rt.self_id()},
        {"channels", codec::to_json(rt.transports().status_report())},
        {"relay", codec::to_json(rt.relay_queue().config())},
        {"queueSize", rt.relay_queue().size()},
        {"beacon", codec::to_json(rt.presence_beacon())},
      };
    } else {
      print_status(rt, ansi);
    }
  }

  if (opt_topology) {
    const Topology t = rt.topology();
    if (as_json) out["topology"] = codec::to_json(t);
    else         print_topology(t, ansi);
  }

  if (opt_pending) {
    const auto entries = rt.relay_queue().pending();
    if (as_json) {
      json arr = json::array();
      for (const auto& e : entries) arr.push_back(codec::to_json(e));
      out["pending"] = arr;
    } else {
      print_pending(entries, ansi);
    }
  }

  if (opt_stats) {
    const MetricsSnapshot m = rt.metrics();
    const auto recent = rt.transmissions(20);
    if (as_json) {
      json arr = json::array();
      for (const auto& rec : recent) arr.push_back(codec::to_json(rec));
      out["stats"] = {{"metrics", codec::to_json(m)}, {"recent", arr}};
    } else {
      std::cout << ansi.bold("STATS") << "  sent " << m.transmissions << " (" << m.bytes_sent << " B)"
                << "  received " << m.receptions << "  relayed " << m.relayed
                << "  parked " << m.store_forward << "  expired " << m.expired
                << "  dropped " << m.dropped << "\n";
      for (const auto& rec : recent) {
        std::cout << "  " << rec.id << "  " << transport::to_string(rec.channel) << "  "
                  << to_string(rec.mode) << "  " << rec.total_bytes << " B → " << rec.destination_id << "\n";
      }
    }
  }

  if (as_json) std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << "\n";

  // Save updated state
  {
    json st;
    st["id"] = rt.self_id();
    st["last_time"] = rt.now();
    if (!codec::atomic_write_json(node_file, st) && exit_code == 0) exit_code = 1;
  }
  if (!rt.save_state()) log::warn("meshctl", "peer roster not saved");
  if (!persist_pending(rt, pending_file)) log::warn("meshctl", "relay queue not saved");

  return exit_code;
}
