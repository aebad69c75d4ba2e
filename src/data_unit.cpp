#include "meshrelay/data_unit.hpp"

namespace meshrelay {

std::string canonical(const DataUnit& unit) {
  return unit.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<DataUnit> parse_unit(std::string_view text) {
  // allow_exceptions=false: malformed input comes back as a discarded value
  DataUnit j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  return j;
}

} // namespace meshrelay
