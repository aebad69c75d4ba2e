// -----------------------------------------------------------------------------
// transport_registry.cpp: availability flags over the fixed channel table
// -----------------------------------------------------------------------------
#include "meshrelay/transport/transport_registry.hpp"

#include "meshrelay/log.hpp"

#include <algorithm>
#include <string>

namespace meshrelay::transport {

// ---------- public ----------

TransportRegistry::TransportRegistry()
: TransportRegistry(std::make_shared<DefaultProbe>()) {}

TransportRegistry::TransportRegistry(std::shared_ptr<IChannelProbe> probe)
: probe_(probe ? std::move(probe) : std::make_shared<DefaultProbe>()) {
  this->probe();                       // start with real flags, not all-false
}

void TransportRegistry::set_probe(std::shared_ptr<IChannelProbe> probe) {
  std::lock_guard<std::mutex> lock(mu_);
  probe_ = probe ? std::move(probe) : std::make_shared<DefaultProbe>();
}

// -----------------------------------------------------------------------------
// probe(): ask the collaborator about every channel.
// POLICY:
//   - Collaborator runs without the lock held (it may touch the OS).
//   - Flags are published in one step so readers never see a half-probe.
// -----------------------------------------------------------------------------
std::array<bool, CHANNEL_COUNT> TransportRegistry::probe() {
  std::shared_ptr<IChannelProbe> p;
  {
    std::lock_guard<std::mutex> lock(mu_);
    p = probe_;
  }

  std::array<bool, CHANNEL_COUNT> flags{};
  size_t usable = 0;
  for (size_t i = 0; i < CHANNEL_COUNT; ++i) {
    flags[i] = p->usable(static_cast<Channel>(i));
    if (flags[i]) ++usable;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    available_ = flags;
  }
  log::debug("transport", std::string("probe '") + p->name() + "' -> "
                          + std::to_string(usable) + " usable channel(s)");
  return flags;
}

bool TransportRegistry::available(Channel ch) const {
  std::lock_guard<std::mutex> lock(mu_);
  return available_[static_cast<size_t>(ch)];
}

void TransportRegistry::set_available(Channel ch, bool usable) {
  std::lock_guard<std::mutex> lock(mu_);
  available_[static_cast<size_t>(ch)] = usable;
}

ChannelSet TransportRegistry::available_channels() const {
  ChannelSet out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (size_t i = 0; i < CHANNEL_COUNT; ++i) {
      if (available_[i]) out.push_back(static_cast<Channel>(i));
    }
  }
  std::sort(out.begin(), out.end(), [](Channel a, Channel b) {
    return profile(a).priority < profile(b).priority;
  });
  return out;
}

bool TransportRegistry::any_available() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::any_of(available_.begin(), available_.end(), [](bool f) { return f; });
}

std::vector<ChannelStatus> TransportRegistry::status_report() const {
  std::vector<ChannelStatus> out;
  out.reserve(CHANNEL_COUNT);
  std::lock_guard<std::mutex> lock(mu_);
  for (size_t i = 0; i < CHANNEL_COUNT; ++i) {
    out.push_back(ChannelStatus{&all_profiles()[i], available_[i], latency_[i]});
  }
  return out;
}

void TransportRegistry::set_latency_ms(Channel ch, uint32_t ms) {
  std::lock_guard<std::mutex> lock(mu_);
  latency_[static_cast<size_t>(ch)] = ms;
}

std::optional<uint32_t> TransportRegistry::latency_ms(Channel ch) const {
  std::lock_guard<std::mutex> lock(mu_);
  return latency_[static_cast<size_t>(ch)];
}

} // namespace meshrelay::transport
