#include "meshrelay/urgency.hpp"

#include "meshrelay/constants.hpp"

namespace meshrelay {

Urgency urgency_from_int(int level) {
  if (level < PRIORITY_MIN) level = PRIORITY_MIN;
  if (level > PRIORITY_MAX) level = PRIORITY_MAX;
  return static_cast<Urgency>(level);
}

// Emergency and threat share the top class; everything at or below general
// waits behind knowledge traffic.
RelayClass relay_class_for(Urgency u) {
  switch (u) {
    case Urgency::Emergency:
    case Urgency::Threat:    return RelayClass::Threat;
    case Urgency::Economic:  return RelayClass::Economic;
    case Urgency::Knowledge: return RelayClass::Knowledge;
    default:                 return RelayClass::General;
  }
}

Urgency urgency_for(RelayClass c) {
  switch (c) {
    case RelayClass::Threat:        return Urgency::Threat;
    case RelayClass::Economic:      return Urgency::Economic;
    case RelayClass::Consciousness: return Urgency::Knowledge;
    case RelayClass::Knowledge:     return Urgency::Knowledge;
    case RelayClass::General:       return Urgency::General;
  }
  return Urgency::General;
}

RelayClass relay_class_from_int(int cls) {
  if (cls < 1) cls = 1;
  if (cls > 5) cls = 5;
  return static_cast<RelayClass>(cls);
}

const char* to_string(Urgency u) {
  switch (u) {
    case Urgency::Emergency:  return "emergency";
    case Urgency::Threat:     return "threat";
    case Urgency::Economic:   return "economic";
    case Urgency::Knowledge:  return "knowledge";
    case Urgency::General:    return "general";
    case Urgency::Low:        return "low";
    case Urgency::Background: return "background";
    case Urgency::Minimal:    return "minimal";
  }
  return "general";
}

const char* to_string(RelayClass c) {
  switch (c) {
    case RelayClass::Threat:        return "THREAT";
    case RelayClass::Economic:      return "ECONOMIC";
    case RelayClass::Consciousness: return "CONSCIOUSNESS";
    case RelayClass::Knowledge:     return "KNOWLEDGE";
    case RelayClass::General:       return "GENERAL";
  }
  return "GENERAL";
}

} // namespace meshrelay
