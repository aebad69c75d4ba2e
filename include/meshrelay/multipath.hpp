/**
 * @file multipath.hpp
 * @brief Spread a multi-component transfer over several channels at once.
 *
 * @details
 * Wide channels take more of the load. Usable channels are ranked by
 * bandwidth (high, low_medium, low, very_low) and each takes a share of the
 * component list in order: high 4, low_medium 2, low 1, very_low 1. If the
 * list is longer than one round of shares, the leftovers go to the first
 * (widest) path.
 *
 * Invariant: every input component lands in exactly one path.
 *
 * A `Transfer` is the record the runtime keeps while it sends a plan.
 */
#ifndef MESHRELAY_MULTIPATH_HPP
#define MESHRELAY_MULTIPATH_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "meshrelay/data_unit.hpp"
#include "meshrelay/error.hpp"
#include "meshrelay/transport/channel.hpp"

namespace meshrelay {

enum class LatencyClass : uint8_t { Low, Medium, High };
const char* to_string(LatencyClass l);

struct PathAssignment {
  transport::Channel    channel{transport::Channel::Internet};
  std::vector<DataUnit> components;
  LatencyClass          estimated_latency{LatencyClass::High};
};

struct MultiPathPlan {
  bool                        ok{false};
  MeshError                   error{MeshError::None};
  std::vector<PathAssignment> paths;
  size_t                      total_components{0};
  std::string                 reason;

  size_t channels_used() const { return paths.size(); }
};

MultiPathPlan plan_multi_path(const std::vector<DataUnit>* components,
                              const transport::ChannelSet& usable);
MultiPathPlan plan_multi_path(const std::vector<DataUnit>& components,
                              const transport::ChannelSet& usable);

enum class TransferStatus : uint8_t { Pending, InProgress, Completed, Failed, Partial };
const char* to_string(TransferStatus s);

struct Transfer {
  std::string           id;
  std::string           destination_id;
  size_t                total_components{0};
  size_t                sent_components{0};
  size_t                failed_components{0};
  transport::ChannelSet channels_used;
  TransferStatus        status{TransferStatus::Pending};
  uint64_t              started_ms{0};
  std::optional<uint64_t> completed_ms;
  std::string           reason;
};

} // namespace meshrelay

#endif // MESHRELAY_MULTIPATH_HPP
