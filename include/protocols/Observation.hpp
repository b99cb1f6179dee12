#pragma once
/** @file  Observation.hpp
 *  @brief Normalised beacon sighting handed from the decoder to the engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// ZoneWatch headers
#include "core/BeaconState.hpp"

namespace zonewatch::protocols {

  struct BeaconObservation {
    std::string beaconId; ///< watchlist id (minor), upper-case
    int rssi{ core::kNoRssi };
    std::optional<std::string> gatewayId; ///< detecting gateway DevEUI, lower-case
    core::TimePoint observedAt{};
    std::string rawId; ///< value as reported, e.g. "001064AF"
  };

  /// Everything extracted from one uplink message.
  struct UplinkBatch {
    std::optional<std::string> applicationId;
    std::optional<std::string> gatewayId;
    std::vector<BeaconObservation> observations;
  };

} // namespace zonewatch::protocols
