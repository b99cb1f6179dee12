/* @file PolicyFactory.cpp
 * @brief name -> ZonePolicy creators
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// ZoneWatch headers
#include "core/PolicyFactory.hpp"
#include "core/Settings.hpp"
#include "protocols/ZonePolicy.hpp"

using namespace zonewatch::core;

PolicyFactory PolicyFactory::withBuiltins() {
  PolicyFactory f;
  f.registerPolicy("signal", [](const AlarmSettings& s) {
    return std::make_unique<protocols::SignalPolicy>(s.safeRssiThreshold, s.higherRssiIsSafer);
  });
  f.registerPolicy("topology", [](const AlarmSettings& s) {
    return std::make_unique<protocols::TopologyPolicy>(s.safeRssiThreshold, s.higherRssiIsSafer);
  });
  return f;
}

bool PolicyFactory::registerPolicy(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<zonewatch::protocols::ZonePolicy>
PolicyFactory::create(const std::string& name, const AlarmSettings& settings) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[PolicyFactory] unknown zone policy: " + name);
  return it->second(settings);
}

std::string PolicyFactory::nameFor(const AlarmSettings& settings) {
  return settings.topologyAware ? "topology" : "signal";
}
