#pragma once
/** @file  Watchlist.hpp
 *  @brief Tracked beacons and floor topology, swappable as a whole on reload.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zonewatch::core {

  class Logger;

  struct BeaconEntry {
    std::string id; ///< normalised minor id, e.g. "64AF"
    std::string name;
    std::optional<std::string> homeFloorId;
  };

  /// One physical zone and the devices installed on it.
  struct Floor {
    std::string id;
    std::string name;
    std::string macroSensorEui;      ///< alarm-capable device on this floor
    std::string bluetoothGatewayEui; ///< BLE gateway reporting detections
  };

  /**
 * @struct WatchlistTable
 * @brief Immutable once published through Watchlist::reload().
 */
  struct WatchlistTable {
    std::map<std::string, BeaconEntry> beacons;
    std::vector<Floor> floors;
    bool autoDiscover{ false };
    std::string defaultDevice; ///< alarm device when no floor applies

    /// Three built-in beacons and one floor driven by \p defaultDevice.
    static WatchlistTable defaults(const std::string& defaultDevice);
  };

  struct Resolution {
    bool tracked{ false };
    std::string beaconId;
    std::string displayName;
  };

  /// Upper-cases, trims and left-pads with '0' to at least 4 characters.
  std::string normalizeBeaconId(std::string_view raw);

  /// Last four characters of a Major+Minor id ("001064AF" -> "64AF").
  std::string minorOf(std::string_view rawId);

  /**
 * @class Watchlist
 * @brief Read-mostly lookup table for the decoder, policies and engine.
 *
 *  * Every lookup pins the table it started with (shared_ptr), so a
 *    concurrent `reload()` is never observed half-way.
 *  * Auto-discovery is off unless the table enables it; it inserts unknown
 *    ids with a generated name (copy-on-write).
 */
  class Watchlist {
  public:
    explicit Watchlist(WatchlistTable table, std::shared_ptr<Logger> logger = nullptr);

    /// @returns tracked=false for unknown ids unless auto-discovery is on.
    Resolution resolve(const std::string& beaconId);

    /// Tracked id contained in a raw Major+Minor value, if any.
    std::optional<std::string> match(const std::string& rawId) const;

    std::optional<std::string> zoneOf(const std::string& gatewayId) const;
    std::optional<std::string> homeZoneOf(const std::string& beaconId) const;

    /// Macro sensor of \p floorId, else the default alarm device.
    std::string alarmDeviceFor(const std::optional<std::string>& floorId) const;
    std::string floorName(const std::optional<std::string>& floorId) const;
    std::string defaultDevice() const;

    std::vector<BeaconEntry> beacons() const;
    std::size_t size() const;

    void reload(WatchlistTable table);

    /// The table as of now; stays valid across later reloads.
    std::shared_ptr<const WatchlistTable> current() const;

  private:

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mtx_;
    std::shared_ptr<const WatchlistTable> table_;
  };

} // namespace zonewatch::core
