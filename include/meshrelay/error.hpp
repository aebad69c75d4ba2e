/**
 * @file error.hpp
 * @brief Error taxonomy for the relay core.
 *
 * @details
 * Nothing in the core throws. Every per-item failure comes back as a value:
 * a result struct carrying `ok == false` and one of these codes. A bad frame
 * or a tampered packet costs you that item, never the batch around it.
 *
 * `to_string()` yields the stable snake_case names used in JSON output and
 * logs (e.g. `invalid_magic`). Do not rename them; tooling greps for them.
 */
#ifndef MESHRELAY_ERROR_HPP
#define MESHRELAY_ERROR_HPP

#include <cstdint>

namespace meshrelay {

enum class MeshError : uint8_t {
  None = 0,
  InvalidMagic,          ///< frame magic mismatch
  CrcMismatch,           ///< frame CRC-16 mismatch
  IntegrityCheckFailed,  ///< packet payload hash mismatch
  MissingRequiredInput,  ///< null unit / packet / frame
  RoutingUnavailable,    ///< no live channel, triggers store-and-forward
  QueueExpired,          ///< relay entry outlived its hold time
  TruncatedFrame,
  UnsupportedVersion,
  MalformedPayload,
  NoComponents,
  NoChannelsAvailable,
  RelayDisabled,
  QueueFull
};

const char* to_string(MeshError e);

} // namespace meshrelay

#endif // MESHRELAY_ERROR_HPP
