/**
 * @file urgency.hpp
 * @brief One urgency scale and one flag byte, shared by packets and frames.
 *
 * @details
 * ## Field Brief
 * A packet header and a wire frame both need to say "this is urgent" and
 * "this is a fragment". They say it with the same vocabulary:
 *
 * - `Urgency`: eight levels, 0 = drop everything, 7 = whenever.
 * - `MeshFlags`: one byte of signal bits carried verbatim by both envelopes.
 * - `RelayClass`: the five store-and-forward classes (1 = first out of the
 *   queue). Derived from urgency, or set explicitly by the caller.
 *
 * | Bit  | Flag           | Meaning                                   |
 * |------|----------------|-------------------------------------------|
 * | 0x01 | Fragment       | payload is one part of a larger unit      |
 * | 0x02 | Relay          | frame was forwarded by an intermediate    |
 * | 0x04 | Emergency      | always gossiped, never suppressed         |
 * | 0x08 | Encrypted      | payload is opaque ciphertext (signal only)|
 * | 0x10 | PriorityBoost  | sender asked for preferential handling    |
 * | 0x20 | StoreForward   | packet was parked in a relay queue        |
 * | 0xC0 | reserved       | must be zero on send, ignored on receive  |
 */
#ifndef MESHRELAY_URGENCY_HPP
#define MESHRELAY_URGENCY_HPP

#include <cstdint>

namespace meshrelay {

enum class Urgency : uint8_t {
  Emergency  = 0,
  Threat     = 1,
  Economic   = 2,
  Knowledge  = 3,
  General    = 4,
  Low        = 5,
  Background = 6,
  Minimal    = 7
};

enum class RelayClass : uint8_t {
  Threat        = 1,
  Economic      = 2,
  Consciousness = 3,
  Knowledge     = 4,
  General       = 5
};

/// Clamp any integer onto the eight-level scale.
Urgency urgency_from_int(int level);

/// Store-and-forward class that serves an urgency level.
RelayClass relay_class_for(Urgency u);

/// Urgency a relay class is framed with.
Urgency urgency_for(RelayClass c);

/// Clamp any integer onto the 1..5 class range.
RelayClass relay_class_from_int(int cls);

const char* to_string(Urgency u);
const char* to_string(RelayClass c);

/**
 * @struct MeshFlags
 * @brief The shared flag byte. Plain value type; reserved bits are masked off.
 */
struct MeshFlags {
  static constexpr uint8_t FRAGMENT       = 0x01;
  static constexpr uint8_t RELAY          = 0x02;
  static constexpr uint8_t EMERGENCY      = 0x04;
  static constexpr uint8_t ENCRYPTED      = 0x08;
  static constexpr uint8_t PRIORITY_BOOST = 0x10;
  static constexpr uint8_t STORE_FORWARD  = 0x20;
  static constexpr uint8_t DEFINED_MASK   = 0x3F;

  uint8_t bits{0};

  MeshFlags() = default;
  explicit MeshFlags(uint8_t raw) : bits(static_cast<uint8_t>(raw & DEFINED_MASK)) {}

  bool has(uint8_t flag) const { return (bits & flag) != 0; }
  void set(uint8_t flag, bool on = true) {
    if (on) bits = static_cast<uint8_t>(bits | flag);
    else    bits = static_cast<uint8_t>(bits & ~flag);
  }

  bool fragment()       const { return has(FRAGMENT); }
  bool relay()          const { return has(RELAY); }
  bool emergency()      const { return has(EMERGENCY); }
  bool encrypted()      const { return has(ENCRYPTED); }
  bool priority_boost() const { return has(PRIORITY_BOOST); }
  bool store_forward()  const { return has(STORE_FORWARD); }

  bool operator==(const MeshFlags& o) const { return bits == o.bits; }
  bool operator!=(const MeshFlags& o) const { return bits != o.bits; }
};

} // namespace meshrelay

#endif // MESHRELAY_URGENCY_HPP
