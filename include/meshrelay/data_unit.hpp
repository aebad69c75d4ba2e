/**
 * @file data_unit.hpp
 * @brief The opaque application record carried by the mesh.
 *
 * @details
 * A data unit is a JSON value. The relay never looks inside it except for the
 * legacy priority shim; it only needs three things from it:
 *
 * - a canonical byte form (`canonical()`), so every node hashes the same bytes;
 * - a way back from those bytes (`parse_unit()`);
 * - deep equality, which `nlohmann::json::operator==` already is.
 *
 * Object keys are ordered (`std::map` backing), so `dump()` is canonical as-is.
 * A JSON `null` is the "no unit" value and is rejected by every operation.
 */
#ifndef MESHRELAY_DATA_UNIT_HPP
#define MESHRELAY_DATA_UNIT_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace meshrelay {

using DataUnit = nlohmann::json;

/// Compact, key-sorted serialization. Invalid UTF-8 is replaced, never thrown on.
std::string canonical(const DataUnit& unit);

/// Parse canonical bytes back into a unit; std::nullopt on malformed text.
std::optional<DataUnit> parse_unit(std::string_view text);

} // namespace meshrelay

#endif // MESHRELAY_DATA_UNIT_HPP
