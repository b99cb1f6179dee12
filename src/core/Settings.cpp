/* @file Settings.cpp
 * @brief JSON -> Settings schema validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ZoneWatch headers
#include "core/ParameterStore.hpp"
#include "core/Settings.hpp"
#include "protocols/CommandBuilder.hpp"

namespace zonewatch::core {

  namespace {

    using nlohmann::json;

    const json& section(const json& root, const char* key) {
      static const json empty = json::object();
      auto it = root.find(key);
      if (it == root.end() || it->is_null())
        return empty;
      if (!it->is_object())
        throw std::runtime_error(std::string("[Settings] \"") + key + "\" must be an object");
      return *it;
    }

    double positive(const json& obj, const char* key, double fallback) {
      const double v = obj.value(key, fallback);
      if (v < 0.0)
        throw std::runtime_error(std::string("[Settings] \"") + key + "\" must not be negative");
      return v;
    }

    std::uint8_t byteValue(const json& obj, const char* key, std::uint8_t fallback) {
      const int v = obj.value(key, static_cast<int>(fallback));
      if (v < 0 || v > 255)
        throw std::runtime_error(std::string("[Settings] \"") + key + "\" must fit in one byte");
      return static_cast<std::uint8_t>(v);
    }

    bool isHex(const std::string& s) {
      if (s.empty())
        return false;
      for (unsigned char c : s)
        if (!std::isxdigit(c))
          return false;
      return true;
    }

    AlarmSettings parseAlarm(const json& a) {
      AlarmSettings out;
      out.safeRssiThreshold = a.value("safe_rssi_threshold", out.safeRssiThreshold);
      out.higherRssiIsSafer = a.value("higher_rssi_is_safer", out.higherRssiIsSafer);
      out.debounceSeconds = positive(a, "debounce_seconds", out.debounceSeconds);
      out.commandDelaySeconds = positive(a, "command_delay_seconds", out.commandDelaySeconds);
      out.maxSilenceSeconds = positive(a, "max_silence_seconds", out.maxSilenceSeconds);
      out.watchdogIntervalSeconds =
          positive(a, "watchdog_interval_seconds", out.watchdogIntervalSeconds);
      if (out.watchdogIntervalSeconds <= 0.0)
        throw std::runtime_error("[Settings] \"watchdog_interval_seconds\" must be > 0");
      out.topologyAware = a.value("topology_aware", out.topologyAware);
      out.targetDevice = a.value("target_device", out.targetDevice);
      out.fport = byteValue(a, "fport", out.fport);
      out.triggerPrefix = byteValue(a, "trigger_prefix", out.triggerPrefix);
      out.volumeLevel = byteValue(a, "volume_level", out.volumeLevel);
      if (out.volumeLevel > protocols::CommandBuilder::kMaxVolume)
        throw std::runtime_error("[Settings] \"volume_level\" must be 0-4");
      out.durationUnits = byteValue(a, "duration_units", out.durationUnits);
      if (auto it = a.find("beacon_major"); it != a.end() && !it->is_null()) {
        std::string major = it->get<std::string>();
        if (major.size() != 4 || !isHex(major))
          throw std::runtime_error("[Settings] \"beacon_major\" must be 4 hex digits");
        out.beaconMajor = normalizeBeaconId(major);
      }
      return out;
    }

    WatchlistTable parseWatchlist(const json& w, const std::string& defaultDevice) {
      WatchlistTable t;
      t.defaultDevice = defaultDevice;
      t.autoDiscover = w.value("auto_discover", false);

      if (auto it = w.find("beacons"); it != w.end()) {
        for (const auto& b : *it) {
          const std::string raw = b.value("id", std::string{});
          if (raw.empty())
            continue;
          BeaconEntry e;
          e.id = normalizeBeaconId(raw);
          if (!isHex(e.id) || e.id.size() % 2 != 0)
            throw std::runtime_error("[Settings] beacon id \"" + raw +
                                     "\" must be an even number of hex digits");
          e.name = b.value("name", "Beacon " + e.id);
          if (auto h = b.find("home_floor_id"); h != b.end() && h->is_string())
            e.homeFloorId = h->get<std::string>();
          t.beacons[e.id] = std::move(e);
        }
      }

      if (auto it = w.find("floors"); it != w.end()) {
        for (const auto& f : *it) {
          Floor floor;
          floor.id = f.value("id", std::string{});
          if (floor.id.empty())
            continue;
          floor.name = f.value("name", floor.id);
          floor.macroSensorEui = f.value("macro_sensor_eui", std::string{});
          floor.bluetoothGatewayEui = f.value("bluetooth_gateway_eui", std::string{});
          t.floors.push_back(std::move(floor));
        }
      }

      // an empty watchlist section means "use the built-in one", not "track nothing"
      if (t.beacons.empty() && t.floors.empty()) {
        WatchlistTable fallback = WatchlistTable::defaults(defaultDevice);
        fallback.autoDiscover = t.autoDiscover;
        return fallback;
      }
      if (t.floors.empty())
        t.floors.push_back(Floor{ "floor_1", "Default Floor", defaultDevice, "" });
      return t;
    }

  } // namespace

  Settings Settings::defaults() {
    Settings s;
    s.watchlist = WatchlistTable::defaults(s.alarm.targetDevice);
    return s;
  }

  Settings parseSettings(const nlohmann::json& root) {
    if (!root.is_object())
      throw std::runtime_error("[Settings] configuration must be a JSON object");

    try {
      Settings s;
      s.alarm = parseAlarm(section(root, "alarm"));
      s.watchlist = parseWatchlist(section(root, "watchlist"), s.alarm.targetDevice);

      const json& t = section(root, "transport");
      s.transport.uplinkPath = t.value("uplink_path", s.transport.uplinkPath);
      s.transport.downlinkPath = t.value("downlink_path", s.transport.downlinkPath);
      s.transport.applicationId = t.value("application_id", s.transport.applicationId);

      const json& l = section(root, "logging");
      s.logging.file = l.value("file", s.logging.file);
      s.logging.level = parseLogLevel(l.value("level", std::string("info")));

      const json& d = section(root, "display");
      s.display.enabled = d.value("enabled", s.display.enabled);
      s.display.refreshSeconds = positive(d, "refresh_seconds", s.display.refreshSeconds);
      s.display.staleSeconds = positive(d, "stale_seconds", s.display.staleSeconds);
      if (s.display.refreshSeconds <= 0.0)
        throw std::runtime_error("[Settings] \"refresh_seconds\" must be > 0");
      return s;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("[Settings] ") + e.what());
    }
  }

  void storeParameters(const Settings& s, ParameterStore& store) {
    store.set(Parameter::DebounceSeconds, s.alarm.debounceSeconds);
    store.set(Parameter::CommandDelaySeconds, s.alarm.commandDelaySeconds);
    store.set(Parameter::MaxSilenceSeconds, s.alarm.maxSilenceSeconds);
    store.set(Parameter::WatchdogIntervalSeconds, s.alarm.watchdogIntervalSeconds);
    store.set(Parameter::DisplayRefreshSeconds, s.display.refreshSeconds);
    store.set(Parameter::DisplayStaleSeconds, s.display.staleSeconds);
  }

} // namespace zonewatch::core
