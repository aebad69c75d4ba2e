// -----------------------------------------------------------------------------
// digest.cpp: SHA-256 / CRC-16 / random ids
//
// SHA-256 goes through the EVP interface (one context per call, freed on every
// path). Randomness comes from RAND_bytes; if the DRBG refuses, we log and
// fall back to std::random_device so id generation never stalls a send.
// -----------------------------------------------------------------------------
#include "meshrelay/digest.hpp"

#include "meshrelay/constants.hpp"
#include "meshrelay/log.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <random>
#include <vector>

namespace meshrelay {

namespace {

struct EvpCtxFree {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxFree>;

} // namespace

bool sha256(std::string_view data, Sha256& out) {
  EvpCtx ctx(EVP_MD_CTX_new());
  if (!ctx) {
    log::error("digest", "EVP_MD_CTX_new failed");
    return false;
  }
  unsigned int len = 0;
  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx.get(), data.data(), data.size()) ||
      !EVP_DigestFinal_ex(ctx.get(), out.data(), &len) ||
      len != out.size()) {
    log::error("digest", "SHA-256 computation failed");
    return false;
  }
  return true;
}

std::string sha256_hex(std::string_view data) {
  Sha256 d{};
  if (!sha256(data, d)) return {};
  return to_hex(d.data(), d.size());
}

// CRC-16/MODBUS: reflected 0x8005 (0xA001), init 0xFFFF, no final xor.
uint16_t crc16(const uint8_t* data, size_t len) {
  uint16_t crc = 0xFFFF;
  if (!data) return crc;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x0001) crc = static_cast<uint16_t>((crc >> 1) ^ 0xA001);
      else              crc = static_cast<uint16_t>(crc >> 1);
    }
  }
  return crc;
}

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* DIGITS = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += DIGITS[data[i] >> 4];
    out += DIGITS[data[i] & 0x0F];
  }
  return out;
}

std::string random_hex(size_t bytes) {
  std::vector<uint8_t> buf(bytes);
  if (bytes == 0) return {};
  if (RAND_bytes(buf.data(), static_cast<int>(bytes)) != 1) {
    log::warn("digest", "RAND_bytes failed; using std::random_device");
    std::random_device rd;
    for (auto& b : buf) b = static_cast<uint8_t>(rd() & 0xFF);
  }
  return to_hex(buf.data(), buf.size());
}

std::string make_id(std::string_view prefix) {
  std::string id(prefix);
  id += '_';
  id += random_hex(ID_RANDOM_BYTES);
  return id;
}

uint32_t short_node_id(std::string_view node_id) {
  if (node_id.empty() || node_id == BROADCAST) return BROADCAST_SHORT_ID;
  Sha256 d{};
  if (!sha256(node_id, d)) return 0;
  return (uint32_t(d[0]) << 24) | (uint32_t(d[1]) << 16) | (uint32_t(d[2]) << 8) | uint32_t(d[3]);
}

} // namespace meshrelay
