#pragma once
/** @file  BeaconState.hpp
 *  @brief Per-beacon alarm state, zone labels and the read-only snapshot type.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zonewatch {
  namespace core {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /**
 * @enum Zone
 * @brief Alarm-level classification of one beacon.
 *
 *  * `Weak` is the pending label used while an unsafe condition is being
 *    debounced, whatever the reason (weak signal or wrong zone).
 *  * `Lost` is entered only by the watchdog.
 */
    enum class Zone : std::uint8_t { Unknown, Safe, Weak, Alarm, Lost };

    /// Why the last observation was judged unsafe.
    enum class UnsafeReason : std::uint8_t { None, WrongZone, WeakSignal };

    inline const char* toString(Zone z) {
      switch (z) {
      case Zone::Unknown:
        return "UNKNOWN";
      case Zone::Safe:
        return "SAFE";
      case Zone::Weak:
        return "WEAK";
      case Zone::Alarm:
        return "ALARM";
      case Zone::Lost:
        return "LOST";
      default:
        return "UNKNOWN";
      }
    }

    inline const char* toString(UnsafeReason r) {
      switch (r) {
      case UnsafeReason::WrongZone:
        return "WRONG_ZONE";
      case UnsafeReason::WeakSignal:
        return "WEAK_SIGNAL";
      default:
        return "NONE";
      }
    }

    /// Sentinel rssi for "no reading yet".
    inline constexpr int kNoRssi = -999;

    /**
 * @struct BeaconState
 * @brief Mutable state of one tracked beacon, owned by AlarmEngine.
 *
 *  * `lastSeen == TimePoint{}` means the beacon was never observed.
 *  * `weakSince` is set iff an unsafe condition is pending or confirmed.
 */
    struct BeaconState {
      std::string beaconId;
      std::string displayName;
      Zone zone{ Zone::Unknown };
      int lastRssi{ kNoRssi };
      TimePoint lastSeen{};
      std::optional<TimePoint> weakSince;
      bool alarmActive{ false };
      bool initialized{ false };
      std::optional<std::string> homeZoneId;
      std::optional<std::string> detectedZoneId;
      std::string location{ "Unknown" };
      std::string alarmDevice; ///< device that last received commands for this beacon
      UnsafeReason lastReason{ UnsafeReason::None };
    };

    /// Consistent copy of the display-relevant fields of a BeaconState.
    struct BeaconSnapshot {
      std::string beaconId;
      std::string displayName;
      Zone zone{ Zone::Unknown };
      int rssi{ kNoRssi };
      TimePoint lastSeen{};
      bool alarmActive{ false };
      std::string location{ "Unknown" };
      UnsafeReason reason{ UnsafeReason::None };
    };

    /// Seconds from \p from to \p to, clamped to zero when the clock went backwards.
    inline double secondsBetween(TimePoint from, TimePoint to) {
      const std::chrono::duration<double> d = to - from;
      return d.count() < 0.0 ? 0.0 : d.count();
    }

  } // namespace core
} // namespace zonewatch
