/* @file ZonePolicy.cpp
 * @brief signal-only and floor-aware safety rules
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// ZoneWatch headers
#include "core/Watchlist.hpp"
#include "protocols/ZonePolicy.hpp"

namespace zonewatch::protocols {

  using core::UnsafeReason;

  SignalPolicy::SignalPolicy(int threshold, bool higherIsSafer)
      : threshold_(threshold), higherIsSafer_(higherIsSafer) {}

  bool SignalPolicy::strongEnough(int rssi) const {
    return higherIsSafer_ ? rssi >= threshold_ : rssi <= threshold_;
  }

  Assessment SignalPolicy::assess(const std::string&, int rssi,
                                  const std::optional<std::string>& gatewayId,
                                  const core::Watchlist& watchlist) const {
    Assessment a;
    if (gatewayId)
      a.detectedZone = watchlist.zoneOf(*gatewayId);
    a.safe = strongEnough(rssi);
    a.reason = a.safe ? UnsafeReason::None : UnsafeReason::WeakSignal;
    return a;
  }

  Assessment TopologyPolicy::assess(const std::string& beaconId, int rssi,
                                    const std::optional<std::string>& gatewayId,
                                    const core::Watchlist& watchlist) const {
    Assessment a;
    if (gatewayId)
      a.detectedZone = watchlist.zoneOf(*gatewayId);
    a.homeZone = watchlist.homeZoneOf(beaconId);

    const bool rightZone = a.detectedZone && a.homeZone && *a.detectedZone == *a.homeZone;
    const bool strong = strongEnough(rssi);

    a.safe = rightZone && strong;
    if (!rightZone)
      a.reason = UnsafeReason::WrongZone;
    else if (!strong)
      a.reason = UnsafeReason::WeakSignal;
    return a;
  }

} // namespace zonewatch::protocols
