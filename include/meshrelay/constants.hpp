/**
 * @file constants.hpp
 * @brief Wire values and policy limits shared across the mesh relay.
 *
 * @details
 * Everything in here is either bit-exact on the wire (magic, version, overheads)
 * or an operator-facing limit (queue ceiling, hold floor). Change a wire value
 * and every deployed node stops understanding you. Change a limit and you change
 * how a node behaves under pressure. Keep both kinds here so they are audited
 * together.
 */
#ifndef MESHRELAY_CONSTANTS_HPP
#define MESHRELAY_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace meshrelay {

// ---------- frame envelope ----------
static constexpr uint16_t FRAME_MAGIC          = 0xCD01;
static constexpr uint8_t  FRAME_VERSION        = 1;
static constexpr size_t   FRAME_HEADER_SIZE    = 18;   // everything before the payload
static constexpr size_t   FRAME_CRC_SIZE       = 2;
static constexpr size_t   FRAME_OVERHEAD       = FRAME_HEADER_SIZE + FRAME_CRC_SIZE; // 20
static constexpr size_t   FRAME_MAX_PAYLOAD    = 0xFFFF; // 16-bit length field
static constexpr uint8_t  PRIORITY_MIN         = 0;    // most urgent
static constexpr uint8_t  PRIORITY_MAX         = 7;    // least urgent

// ---------- packet envelope ----------
static constexpr size_t   MESH_HEADER_SIZE     = 16;
static constexpr size_t   UNIT_HEADER_SIZE     = 48;   // opaque unit metadata
static constexpr size_t   PACKET_OVERHEAD      = MESH_HEADER_SIZE + UNIT_HEADER_SIZE; // 64
static constexpr int      TTL_MIN              = 0;
static constexpr int      TTL_MAX              = 255;
static constexpr int      TTL_DEFAULT          = 7;
static constexpr size_t   FRAGMENT_TOTAL_MAX   = 255;  // one byte on the header
static constexpr size_t   FRAGMENT_CHUNK_FLOOR = 64;
static constexpr size_t   FRAGMENT_HASH_HEX    = 16;   // chunk hash, hex chars
static constexpr uint32_t BROADCAST_SHORT_ID   = 0xFFFFFFFFu;

// ---------- relay queue ----------
static constexpr size_t   RELAY_QUEUE_MIN      = 10;
static constexpr size_t   RELAY_QUEUE_CEILING  = 10000;
static constexpr size_t   RELAY_QUEUE_DEFAULT  = 1000;
static constexpr int64_t  RELAY_HOLD_FLOOR_MS  = 60000;                   // 1 minute
static constexpr int64_t  RELAY_HOLD_CAP_MS    = 7LL * 24 * 3600 * 1000;  // 7 days
static constexpr int64_t  RELAY_HOLD_DEFAULT_MS= 24LL * 3600 * 1000;      // 24 hours
static constexpr uint32_t RELAY_MAX_ATTEMPTS   = 10;

// ---------- dedup / gossip ----------
static constexpr size_t   SEEN_PRUNE_THRESHOLD = 10000;
static constexpr uint64_t SEEN_RETENTION_MS    = 3600ULL * 1000;           // 1 hour
static constexpr double   GOSSIP_NOVELTY_WEIGHT= 0.8;
static constexpr double   GOSSIP_BASE_RATE     = 0.1;

// ---------- heartbeat ----------
static constexpr uint64_t BEACON_EVERY_TICKS   = 10;
static constexpr uint64_t SWEEP_EVERY_TICKS    = 50;
static constexpr uint64_t STALE_PEER_WINDOW_MS = 2ULL * 3600 * 1000;      // 2 hours
static constexpr uint64_t TRANSFER_RETENTION_MS= 3600ULL * 1000;          // 1 hour

// ---------- misc ----------
static constexpr size_t   TX_LOG_CAP           = 512;
static constexpr size_t   ID_RANDOM_BYTES      = 10;   // 20 hex chars after the prefix
static constexpr const char* PROTOCOL_VERSION  = "1.0.0";
static constexpr const char* BROADCAST         = "broadcast";

} // namespace meshrelay

#endif // MESHRELAY_CONSTANTS_HPP
