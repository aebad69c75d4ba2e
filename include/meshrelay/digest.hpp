/**
 * @file digest.hpp
 * @brief Hashing, checksums and random identifiers.
 *
 * @details
 * - SHA-256 (OpenSSL EVP) guards packet payloads end to end.
 * - CRC-16/MODBUS (init 0xFFFF, reflected poly 0xA001) guards frames per hop.
 * - `make_id("pkt")` → `pkt_` + 20 lowercase hex chars from `RAND_bytes`.
 *
 * None of these throw. A failing EVP context yields an empty digest, which
 * never matches a real one, so verification fails closed.
 */
#ifndef MESHRELAY_DIGEST_HPP
#define MESHRELAY_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace meshrelay {

using Sha256 = std::array<uint8_t, 32>;

/// Raw digest; `ok` is false only if the EVP context could not be driven.
bool sha256(std::string_view data, Sha256& out);

/// Lowercase hex digest (64 chars), or empty on failure.
std::string sha256_hex(std::string_view data);

/// CRC-16/MODBUS over `len` bytes.
uint16_t crc16(const uint8_t* data, size_t len);

std::string to_hex(const uint8_t* data, size_t len);

/// `bytes` random bytes rendered as hex.
std::string random_hex(size_t bytes);

/// `prefix_` + 20 hex characters.
std::string make_id(std::string_view prefix);

/// 32-bit wire form of a node id: first four digest bytes, broadcast → 0xFFFFFFFF.
uint32_t short_node_id(std::string_view node_id);

} // namespace meshrelay

#endif // MESHRELAY_DIGEST_HPP
