#pragma once
/** @file  AlarmEngine.hpp
 *  @brief Per-beacon debounced alarm state machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// ZoneWatch headers
#include "core/BeaconState.hpp"
#include "core/EventBus.hpp"

namespace zonewatch::protocols {
  class ZonePolicy;
  struct BeaconObservation;
} // namespace zonewatch::protocols

namespace zonewatch {
  namespace core {

    class CommandDispatcher;
    class Logger;
    class ParameterStore;
    class Watchlist;

    /**
 * @class AlarmEngine
 * @brief Owns the beacon state table and decides SAFE / WEAK / ALARM / LOST.
 *
 *  * Two writers: the uplink thread (`onObservation`) and the watchdog
 *    (`watchdogTick`). One mutex guards the whole table; commands are queued
 *    while it is held so per-beacon ordering is preserved.
 *  * Events are published after the table lock is released, so subscribers
 *    may call `snapshot()`. A second mutex is held across evaluation and
 *    publishing so events leave in the order the state changed, whichever
 *    thread caused them. Subscribers must not feed the engine back
 *    (`onObservation` / `watchdogTick`) from inside a handler.
 *  * First sighting of a beacon always silences and reports SAFE.
 *  * Unsafe readings must persist for the debounce window before a trigger;
 *    a single safe reading clears immediately.
 */
    class AlarmEngine {
    public:
      AlarmEngine(std::shared_ptr<Watchlist> watchlist, std::shared_ptr<const ParameterStore> params,
                  std::shared_ptr<CommandDispatcher> dispatcher, std::shared_ptr<EventBus> bus,
                  std::shared_ptr<Logger> logger,
                  std::shared_ptr<const protocols::ZonePolicy> policy);
      ~AlarmEngine() = default;

      //---public API-----------------------------------------------------
      Zone onObservation(const std::string& beaconId, int rssi,
                         const std::optional<std::string>& gatewayId, TimePoint now);
      Zone onObservation(const protocols::BeaconObservation& obs);

      /// Marks silent beacons LOST and triggers once per silence.
      void watchdogTick(TimePoint now);

      std::map<std::string, BeaconSnapshot> snapshot() const;
      std::optional<BeaconSnapshot> snapshotOf(const std::string& beaconId) const;

      /// Pre-register every watchlist beacon as UNKNOWN (for the display).
      void seedFromWatchlist();

      void setPolicy(std::shared_ptr<const protocols::ZonePolicy> policy);

      AlarmEngine(const AlarmEngine&) = delete;
      AlarmEngine& operator=(const AlarmEngine&) = delete;

    private:
      struct Outgoing {
        std::string name;
        BeaconEvent event;
      };

      BeaconState& stateFor(const std::string& beaconId, const std::string& displayName);
      Zone evaluateLocked(BeaconState& st, int rssi, const std::optional<std::string>& gatewayId,
                          TimePoint now, std::vector<Outgoing>& out);
      std::string routeFor(const BeaconState& st) const;
      void publishAll(const std::vector<Outgoing>& out) const;
      static BeaconEvent eventFor(const BeaconState& st, Zone oldZone, TimePoint now);
      static BeaconSnapshot toSnapshot(const BeaconState& st);

      std::shared_ptr<Watchlist> watchlist_;
      std::shared_ptr<const ParameterStore> params_;
      std::shared_ptr<CommandDispatcher> dispatcher_;
      std::shared_ptr<EventBus> bus_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<const protocols::ZonePolicy> policy_;

      std::mutex publishMtx_; ///< taken before mtx_, released after publishing
      mutable std::mutex mtx_;
      std::map<std::string, BeaconState> states_;
    };

  } // namespace core
} // namespace zonewatch
