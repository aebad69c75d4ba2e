#include "meshrelay/error.hpp"

namespace meshrelay {

const char* to_string(MeshError e) {
  switch (e) {
    case MeshError::None:                 return "none";
    case MeshError::InvalidMagic:         return "invalid_magic";
    case MeshError::CrcMismatch:          return "crc_mismatch";
    case MeshError::IntegrityCheckFailed: return "integrity_check_failed";
    case MeshError::MissingRequiredInput: return "missing_required_input";
    case MeshError::RoutingUnavailable:   return "routing_unavailable";
    case MeshError::QueueExpired:         return "queue_expired";
    case MeshError::TruncatedFrame:       return "truncated_frame";
    case MeshError::UnsupportedVersion:   return "unsupported_version";
    case MeshError::MalformedPayload:     return "malformed_payload";
    case MeshError::NoComponents:         return "no_components";
    case MeshError::NoChannelsAvailable:  return "no_channels_available";
    case MeshError::RelayDisabled:        return "relay_disabled";
    case MeshError::QueueFull:            return "queue_full";
  }
  return "unknown";
}

} // namespace meshrelay
