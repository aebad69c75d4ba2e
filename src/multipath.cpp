#include "meshrelay/multipath.hpp"

#include <algorithm>

namespace meshrelay {

using transport::Bandwidth;
using transport::Channel;
using transport::Speed;

namespace {

int bandwidth_rank(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return 4;
    case Bandwidth::LowMedium: return 2;
    case Bandwidth::Low:       return 1;
    case Bandwidth::VeryLow:   return 0;
  }
  return 0;
}

size_t bandwidth_share(Bandwidth b) {
  switch (b) {
    case Bandwidth::High:      return 4;
    case Bandwidth::LowMedium: return 2;
    default:                   return 1;
  }
}

LatencyClass latency_for(Speed s) {
  if (s == Speed::High)   return LatencyClass::Low;
  if (s == Speed::Medium) return LatencyClass::Medium;
  return LatencyClass::High;
}

} // namespace

const char* to_string(LatencyClass l) {
  switch (l) {
    case LatencyClass::Low:    return "low";
    case LatencyClass::Medium: return "medium";
    case LatencyClass::High:   return "high";
  }
  return "high";
}

const char* to_string(TransferStatus s) {
  switch (s) {
    case TransferStatus::Pending:    return "pending";
    case TransferStatus::InProgress: return "in_progress";
    case TransferStatus::Completed:  return "completed";
    case TransferStatus::Failed:     return "failed";
    case TransferStatus::Partial:    return "partial";
  }
  return "pending";
}

// -----------------------------------------------------------------------------
// plan_multi_path()
// PRE:    non-empty component list, at least one usable channel.
// POLICY: one pass of bandwidth shares, widest first; overflow to path 0.
// OUT:    ok plan covering each component exactly once.
// -----------------------------------------------------------------------------
MultiPathPlan plan_multi_path(const std::vector<DataUnit>* components,
                              const transport::ChannelSet& usable) {
  MultiPathPlan plan;
  if (!components || components->empty()) {
    plan.error  = MeshError::NoComponents;
    plan.reason = "no_components";
    return plan;
  }
  if (usable.empty()) {
    plan.error  = MeshError::NoChannelsAvailable;
    plan.reason = "no_channels_available";
    return plan;
  }

  transport::ChannelSet ordered = usable;
  std::stable_sort(ordered.begin(), ordered.end(), [](Channel a, Channel b) {
    return bandwidth_rank(transport::profile(a).bandwidth) > bandwidth_rank(transport::profile(b).bandwidth);
  });

  const size_t n = components->size();
  size_t next = 0;
  for (Channel ch : ordered) {
    if (next >= n) break;
    const auto& s = transport::profile(ch);
    const size_t take = std::min(bandwidth_share(s.bandwidth), n - next);

    PathAssignment path;
    path.channel           = ch;
    path.estimated_latency = latency_for(s.speed);
    path.components.assign(components->begin() + next, components->begin() + next + take);
    next += take;
    plan.paths.push_back(std::move(path));
  }

  // leftovers ride the widest path
  while (next < n) plan.paths.front().components.push_back((*components)[next++]);

  plan.ok               = true;
  plan.total_components = n;
  plan.reason           = plan.paths.size() > 1 ? "multi_path_distribution" : "single_path";
  return plan;
}

MultiPathPlan plan_multi_path(const std::vector<DataUnit>& components,
                              const transport::ChannelSet& usable) {
  return plan_multi_path(&components, usable);
}

} // namespace meshrelay
