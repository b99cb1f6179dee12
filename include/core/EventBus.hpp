#pragma once
/** @file  EventBus.hpp
 *  @brief In-process publish point for beacon state transitions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// ZoneWatch headers
#include "core/BeaconState.hpp"

namespace zonewatch::core {

  class Logger;

  inline constexpr const char* kStateChangeEvent = "beacon_state_change";
  inline constexpr const char* kAlarmTriggeredEvent = "alarm_triggered";
  inline constexpr const char* kAlarmSilencedEvent = "alarm_silenced";

  /// Typed payload delivered to every subscriber.
  struct BeaconEvent {
    std::string beaconId;
    std::string displayName;
    Zone oldZone{ Zone::Unknown };
    Zone newZone{ Zone::Unknown };
    int rssi{ kNoRssi };
    UnsafeReason reason{ UnsafeReason::None };
    std::string device; ///< alarm device involved, empty for pure state changes
    TimePoint at{};
  };

  /**
 * @class EventBus
 * @brief Synchronous fan-out to handlers registered at start-up.
 *
 *  * Handlers run on the publisher's thread, in subscription order.
 *  * A throwing handler is logged and skipped; the others still run and
 *    nothing propagates to the publisher.
 *  * `seal()` ends the registration phase; later `subscribe()` throws
 *    `std::logic_error`.
 */
  class EventBus {
  public:
    using Handler = std::function<void(const BeaconEvent&)>;

    explicit EventBus(std::shared_ptr<Logger> logger = nullptr);

    void subscribe(const std::string& eventName, Handler handler);
    void seal();
    bool sealed() const;

    void publish(const std::string& eventName, const BeaconEvent& event) const;

    std::size_t subscriberCount(const std::string& eventName) const;

  private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::vector<Handler>> handlers_;
    bool sealed_{ false };
  };

} // namespace zonewatch::core
