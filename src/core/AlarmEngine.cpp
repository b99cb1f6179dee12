/* @file AlarmEngine.cpp
 * @brief debounced SAFE/WEAK/ALARM/LOST decisions per beacon
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <sstream>

// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/Logger.hpp"
#include "core/ParameterStore.hpp"
#include "core/Watchlist.hpp"
#include "protocols/Observation.hpp"
#include "protocols/ZonePolicy.hpp"

namespace zonewatch::core {

  AlarmEngine::AlarmEngine(std::shared_ptr<Watchlist> watchlist,
                           std::shared_ptr<const ParameterStore> params,
                           std::shared_ptr<CommandDispatcher> dispatcher,
                           std::shared_ptr<EventBus> bus, std::shared_ptr<Logger> logger,
                           std::shared_ptr<const protocols::ZonePolicy> policy)
      : watchlist_(std::move(watchlist)), params_(std::move(params)),
        dispatcher_(std::move(dispatcher)), bus_(std::move(bus)), logger_(std::move(logger)),
        policy_(std::move(policy)) {
    assert(watchlist_ && "[AlarmEngine] watchlist is nullptr");
    assert(params_ && "[AlarmEngine] parameter store is nullptr");
    assert(dispatcher_ && "[AlarmEngine] dispatcher is nullptr");
    assert(policy_ && "[AlarmEngine] zone policy is nullptr");
  }

  void AlarmEngine::setPolicy(std::shared_ptr<const protocols::ZonePolicy> policy) {
    if (!policy)
      return;
    std::lock_guard<std::mutex> lock(mtx_);
    policy_ = std::move(policy);
  }

  void AlarmEngine::seedFromWatchlist() {
    const auto entries = watchlist_->beacons();
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& e : entries)
      stateFor(e.id, e.name);
  }

  BeaconState& AlarmEngine::stateFor(const std::string& beaconId, const std::string& displayName) {
    auto [it, inserted] = states_.try_emplace(beaconId);
    BeaconState& st = it->second;
    if (inserted)
      st.beaconId = beaconId;
    st.displayName = displayName; // follows renames on reload
    return st;
  }

  std::string AlarmEngine::routeFor(const BeaconState& st) const {
    if (policy_->zoneAware())
      return watchlist_->alarmDeviceFor(st.detectedZoneId);
    return watchlist_->defaultDevice();
  }

  BeaconEvent AlarmEngine::eventFor(const BeaconState& st, Zone oldZone, TimePoint now) {
    return BeaconEvent{ st.beaconId, st.displayName, oldZone, st.zone, st.lastRssi,
                        st.lastReason, {}, now };
  }

  BeaconSnapshot AlarmEngine::toSnapshot(const BeaconState& st) {
    return BeaconSnapshot{ st.beaconId, st.displayName, st.zone,     st.lastRssi,
                           st.lastSeen, st.alarmActive, st.location, st.lastReason };
  }

  Zone AlarmEngine::onObservation(const protocols::BeaconObservation& obs) {
    return onObservation(obs.beaconId, obs.rssi, obs.gatewayId, obs.observedAt);
  }

  Zone AlarmEngine::onObservation(const std::string& beaconId, int rssi,
                                  const std::optional<std::string>& gatewayId, TimePoint now) {
    const Resolution r = watchlist_->resolve(beaconId);
    if (!r.tracked) {
      if (logger_)
        logger_->log(LogLevel::Debug, "AlarmEngine", "ignoring untracked beacon " + r.beaconId);
      return Zone::Unknown;
    }

    std::lock_guard<std::mutex> ordered(publishMtx_);
    std::vector<Outgoing> out;
    Zone result;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      BeaconState& st = stateFor(r.beaconId, r.displayName);
      result = evaluateLocked(st, rssi, gatewayId, now, out);
    }
    publishAll(out);
    return result;
  }

  Zone AlarmEngine::evaluateLocked(BeaconState& st, int rssi,
                                   const std::optional<std::string>& gatewayId, TimePoint now,
                                   std::vector<Outgoing>& out) {
    const Zone oldZone = st.zone;
    st.lastRssi = rssi;
    st.lastSeen = now;

    const protocols::Assessment a = policy_->assess(st.beaconId, rssi, gatewayId, *watchlist_);
    st.detectedZoneId = a.detectedZone;
    st.homeZoneId = a.homeZone;
    st.location = watchlist_->floorName(a.detectedZone);
    st.lastReason = a.reason;
    const std::string device = routeFor(st);

    // no baseline yet: never alarm on the very first sighting
    if (!st.initialized) {
      dispatcher_->silence(device, st.beaconId);
      st.alarmDevice = device;
      st.initialized = true;
      st.zone = Zone::Safe;
      st.weakSince.reset();
      st.alarmActive = false;
      if (logger_)
        logger_->log(LogLevel::Info, "AlarmEngine",
                     "first sighting of " + st.beaconId + " (rssi " + std::to_string(rssi) +
                         "), forcing silence");
      return Zone::Safe;
    }

    if (a.safe) {
      st.weakSince.reset();
      if (st.alarmActive) {
        const std::string buzzing = st.alarmDevice.empty() ? device : st.alarmDevice;
        dispatcher_->silence(buzzing, st.beaconId);
        st.alarmActive = false;
        st.zone = Zone::Safe;
        BeaconEvent ev = eventFor(st, oldZone, now);
        ev.device = buzzing;
        out.push_back({ kAlarmSilencedEvent, ev });
      }
      st.zone = Zone::Safe;
      if (oldZone != Zone::Safe && oldZone != Zone::Unknown)
        out.push_back({ kStateChangeEvent, eventFor(st, oldZone, now) });
      return Zone::Safe;
    }

    // unsafe from here on
    if (st.alarmActive) {
      if (!st.weakSince)
        st.weakSince = now;
      st.zone = Zone::Alarm;
      if (oldZone != Zone::Alarm)
        out.push_back({ kStateChangeEvent, eventFor(st, oldZone, now) });
      return Zone::Alarm;
    }

    if (!st.weakSince) {
      st.weakSince = now;
      st.zone = Zone::Weak;
      if (oldZone != Zone::Weak)
        out.push_back({ kStateChangeEvent, eventFor(st, oldZone, now) });
      if (logger_)
        logger_->log(LogLevel::Info, "AlarmEngine",
                     st.beaconId + " leaving safe zone (" + toString(a.reason) + ", rssi " +
                         std::to_string(rssi) + ", at " + st.location + ")");
      return Zone::Weak;
    }

    const double held = secondsBetween(*st.weakSince, now);
    if (held < params_->get(Parameter::DebounceSeconds, 5.0)) {
      st.zone = Zone::Weak;
      return Zone::Weak;
    }

    dispatcher_->trigger(device, st.beaconId);
    st.alarmDevice = device;
    st.alarmActive = true;
    st.zone = Zone::Alarm;

    BeaconEvent triggered = eventFor(st, oldZone, now);
    triggered.device = device;
    out.push_back({ kAlarmTriggeredEvent, triggered });
    out.push_back({ kStateChangeEvent, eventFor(st, oldZone, now) });

    if (logger_) {
      std::ostringstream os;
      os << st.beaconId << " ALARM after " << held << " s unsafe (" << toString(a.reason)
         << ", rssi " << rssi << ", at " << st.location << ") -> " << device;
      logger_->log(LogLevel::Warn, "AlarmEngine", os.str());
    }
    return Zone::Alarm;
  }

  void AlarmEngine::watchdogTick(TimePoint now) {
    std::lock_guard<std::mutex> ordered(publishMtx_);
    std::vector<Outgoing> out;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      const double maxSilence = params_->get(Parameter::MaxSilenceSeconds, 120.0);

      for (auto& [id, st] : states_) {
        if (st.lastSeen == TimePoint{} || st.zone == Zone::Lost)
          continue;
        const double silent = secondsBetween(st.lastSeen, now);
        if (silent <= maxSilence)
          continue;

        const Zone oldZone = st.zone;
        st.zone = Zone::Lost;
        if (!st.alarmActive) {
          const std::string device = st.alarmDevice.empty() ? routeFor(st) : st.alarmDevice;
          dispatcher_->trigger(device, st.beaconId);
          st.alarmDevice = device;
          st.alarmActive = true;
          BeaconEvent ev = eventFor(st, oldZone, now);
          ev.device = device;
          out.push_back({ kAlarmTriggeredEvent, ev });
        }
        if (!st.weakSince)
          st.weakSince = now;
        out.push_back({ kStateChangeEvent, eventFor(st, oldZone, now) });

        if (logger_)
          logger_->log(LogLevel::Warn, "AlarmEngine",
                       id + " LOST: no signal for " + std::to_string(static_cast<long>(silent)) +
                           " s");
      }
    }
    publishAll(out);
  }

  void AlarmEngine::publishAll(const std::vector<Outgoing>& out) const {
    if (!bus_)
      return;
    for (const auto& o : out)
      bus_->publish(o.name, o.event);
  }

  std::map<std::string, BeaconSnapshot> AlarmEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, BeaconSnapshot> out;
    for (const auto& [id, st] : states_)
      out.emplace(id, toSnapshot(st));
    return out;
  }

  std::optional<BeaconSnapshot> AlarmEngine::snapshotOf(const std::string& beaconId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = states_.find(normalizeBeaconId(beaconId));
    if (it == states_.end())
      return std::nullopt;
    return toSnapshot(it->second);
  }

} // namespace zonewatch::core
