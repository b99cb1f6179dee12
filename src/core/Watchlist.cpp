/* @file Watchlist.cpp
 * @brief beacon / floor lookups over an atomically replaced table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// ZoneWatch headers
#include "core/Logger.hpp"
#include "core/Watchlist.hpp"

namespace zonewatch::core {

  namespace {

    bool equalsIgnoreCase(std::string_view a, std::string_view b) {
      return a.size() == b.size() &&
             std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
             });
    }

    const Floor* findFloor(const WatchlistTable& t, const std::optional<std::string>& floorId) {
      if (!floorId)
        return nullptr;
      for (const auto& f : t.floors)
        if (f.id == *floorId)
          return &f;
      return nullptr;
    }

  } // namespace

  std::string normalizeBeaconId(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw)
      if (!std::isspace(c))
        out += static_cast<char>(std::toupper(c));
    if (out.size() < 4)
      out.insert(0, 4 - out.size(), '0');
    return out;
  }

  std::string minorOf(std::string_view rawId) {
    std::string id = normalizeBeaconId(rawId);
    return id.substr(id.size() - 4);
  }

  WatchlistTable WatchlistTable::defaults(const std::string& defaultDevice) {
    WatchlistTable t;
    for (const char* id : { "64B0", "64AF", "64AE" })
      t.beacons.emplace(id, BeaconEntry{ id, std::string("Beacon ") + id, std::nullopt });
    t.floors.push_back(Floor{ "floor_1", "Default Floor", defaultDevice, "" });
    t.defaultDevice = defaultDevice;
    return t;
  }

  Watchlist::Watchlist(WatchlistTable table, std::shared_ptr<Logger> logger)
      : logger_(std::move(logger)),
        table_(std::make_shared<const WatchlistTable>(std::move(table))) {}

  std::shared_ptr<const WatchlistTable> Watchlist::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return table_;
  }

  void Watchlist::reload(WatchlistTable table) {
    auto next = std::make_shared<const WatchlistTable>(std::move(table));
    std::lock_guard<std::mutex> lock(mtx_);
    table_ = std::move(next);
  }

  Resolution Watchlist::resolve(const std::string& beaconId) {
    const std::string id = normalizeBeaconId(beaconId);

    {
      auto t = current();
      if (auto it = t->beacons.find(id); it != t->beacons.end())
        return Resolution{ true, id, it->second.name };
      if (!t->autoDiscover)
        return Resolution{ false, id, "Beacon " + id };
    }

    std::string name = "Auto-Discovered " + id;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      // re-check against the latest table, another thread may have won
      if (auto it = table_->beacons.find(id); it != table_->beacons.end())
        return Resolution{ true, id, it->second.name };
      auto next = std::make_shared<WatchlistTable>(*table_);
      next->beacons.emplace(id, BeaconEntry{ id, name, std::nullopt });
      table_ = std::move(next);
    }

    if (logger_)
      logger_->log(LogLevel::Warn, "Watchlist", "auto-discovered beacon " + id);
    return Resolution{ true, id, name };
  }

  std::optional<std::string> Watchlist::match(const std::string& rawId) const {
    const std::string raw = normalizeBeaconId(rawId);
    auto t = current();
    for (const auto& [id, entry] : t->beacons) {
      if (raw.find(id) != std::string::npos)
        return id;
    }
    return std::nullopt;
  }

  std::optional<std::string> Watchlist::zoneOf(const std::string& gatewayId) const {
    if (gatewayId.empty())
      return std::nullopt;
    auto t = current();
    for (const auto& f : t->floors) {
      if ((!f.macroSensorEui.empty() && equalsIgnoreCase(f.macroSensorEui, gatewayId)) ||
          (!f.bluetoothGatewayEui.empty() && equalsIgnoreCase(f.bluetoothGatewayEui, gatewayId)))
        return f.id;
    }
    return std::nullopt;
  }

  std::optional<std::string> Watchlist::homeZoneOf(const std::string& beaconId) const {
    auto t = current();
    auto it = t->beacons.find(normalizeBeaconId(beaconId));
    if (it == t->beacons.end())
      return std::nullopt;
    return it->second.homeFloorId;
  }

  std::string Watchlist::alarmDeviceFor(const std::optional<std::string>& floorId) const {
    auto t = current();
    if (const Floor* f = findFloor(*t, floorId); f && !f->macroSensorEui.empty())
      return f->macroSensorEui;
    return t->defaultDevice;
  }

  std::string Watchlist::floorName(const std::optional<std::string>& floorId) const {
    auto t = current();
    if (const Floor* f = findFloor(*t, floorId))
      return f->name.empty() ? f->id : f->name;
    return "Unknown";
  }

  std::string Watchlist::defaultDevice() const { return current()->defaultDevice; }

  std::vector<BeaconEntry> Watchlist::beacons() const {
    auto t = current();
    std::vector<BeaconEntry> out;
    out.reserve(t->beacons.size());
    for (const auto& [id, entry] : t->beacons)
      out.push_back(entry);
    return out;
  }

  std::size_t Watchlist::size() const { return current()->beacons.size(); }

} // namespace zonewatch::core
