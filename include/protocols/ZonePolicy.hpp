#pragma once
/** @file  ZonePolicy.hpp
 *  @brief Abstract safe/unsafe decision for a single observation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// ZoneWatch headers
#include "core/BeaconState.hpp"

namespace zonewatch::core { // forward decls only—keeps dependency light
  class Watchlist;
} // namespace zonewatch::core

namespace zonewatch::protocols {

  struct Assessment {
    bool safe{ false };
    core::UnsafeReason reason{ core::UnsafeReason::None };
    std::optional<std::string> detectedZone;
    std::optional<std::string> homeZone;
  };

  /**
 * @class ZonePolicy
 * @brief Common polymorphic interface for the signal-only and the
 *        topology-aware rule.
 *
 *  * Pure: no state, no I/O; the engine owns everything temporal.
 *  * Wrong zone wins over weak signal when both apply.
 */
  class ZonePolicy {
  public:
    virtual ~ZonePolicy() = default;

    virtual Assessment assess(const std::string& beaconId, int rssi,
                              const std::optional<std::string>& gatewayId,
                              const core::Watchlist& watchlist) const = 0;

    virtual const char* name() const = 0;

    /// Route commands to the detecting floor's device instead of the default one.
    virtual bool zoneAware() const { return false; }
  };

  /**
 * @class SignalPolicy
 * @brief Safe iff the rssi is on the safe side of the threshold.
 *
 *  With `higherIsSafer` (the default) that is `rssi >= threshold`; the
 *  reversed reading is kept only for sites that mount the gateway away from
 *  the zone it guards.
 */
  class SignalPolicy : public ZonePolicy {
  public:
    SignalPolicy(int threshold, bool higherIsSafer = true);

    Assessment assess(const std::string& beaconId, int rssi,
                      const std::optional<std::string>& gatewayId,
                      const core::Watchlist& watchlist) const override;

    const char* name() const override { return "signal"; }

  protected:
    bool strongEnough(int rssi) const;

  private:
    int threshold_;
    bool higherIsSafer_;
  };

  /**
 * @class TopologyPolicy
 * @brief Safe iff detected on the beacon's home floor AND strong enough.
 *
 *  An unknown gateway or a beacon without a home floor counts as wrong zone.
 */
  class TopologyPolicy : public SignalPolicy {
  public:
    using SignalPolicy::SignalPolicy;

    Assessment assess(const std::string& beaconId, int rssi,
                      const std::optional<std::string>& gatewayId,
                      const core::Watchlist& watchlist) const override;

    const char* name() const override { return "topology"; }
    bool zoneAware() const override { return true; }
  };

} // namespace zonewatch::protocols
