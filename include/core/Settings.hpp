#pragma once
/** @file  Settings.hpp
 *  @brief Typed view of the JSON configuration, with defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

// ZoneWatch headers
#include "core/Logger.hpp"
#include "core/Watchlist.hpp"

namespace zonewatch::core {

  class ParameterStore;

  inline constexpr const char* kDefaultAlarmDevice = "70b3d5a4d31205ce";

  struct AlarmSettings {
    int safeRssiThreshold{ -70 };
    bool higherRssiIsSafer{ true }; ///< nearer = stronger = safer
    double debounceSeconds{ 5.0 };
    double commandDelaySeconds{ 2.0 };
    double maxSilenceSeconds{ 120.0 };
    double watchdogIntervalSeconds{ 5.0 };
    bool topologyAware{ false };
    std::string targetDevice{ kDefaultAlarmDevice };
    std::uint8_t fport{ 10 };
    std::optional<std::string> beaconMajor; ///< 4 hex digits inserted before the minor
    std::uint8_t triggerPrefix{ 0xAC };
    std::uint8_t volumeLevel{ 4 };   ///< loudest
    std::uint8_t durationUnits{ 6 }; ///< 10 s units, 6 = 60 s
  };

  struct TransportSettings {
    std::string uplinkPath{ "-" };   ///< "-" = stdin
    std::string downlinkPath{ "-" }; ///< "-" = stdout
    std::string applicationId;       ///< used until one is learnt from an uplink
  };

  struct LoggingSettings {
    std::string file; ///< empty = stderr only
    LogLevel level{ LogLevel::Info };
  };

  struct DisplaySettings {
    bool enabled{ true };
    double refreshSeconds{ 1.0 };
    double staleSeconds{ 120.0 };
  };

  struct Settings {
    AlarmSettings alarm;
    WatchlistTable watchlist;
    TransportSettings transport;
    LoggingSettings logging;
    DisplaySettings display;

    /// Built-in configuration used when the file is missing or broken.
    static Settings defaults();
  };

  /**
   * Validate \p root and fill in defaults.
   * @throws std::runtime_error on wrong types or out-of-range values.
   */
  Settings parseSettings(const nlohmann::json& root);

  /// Publish the reloadable tunables of \p s into \p store.
  void storeParameters(const Settings& s, ParameterStore& store);

} // namespace zonewatch::core
