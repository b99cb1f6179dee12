#include "core/ConfigLoader.hpp"
#include "core/ParameterStore.hpp"
#include "core/Settings.hpp"
#include "core/Watchlist.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <thread>

#include <unistd.h>

using namespace zonewatch::core;
using nlohmann::json;

namespace {
  std::string writeTemp(const char* tag, const std::string& text) {
    const std::string path = std::string(::testing::TempDir()) + "zonewatch_" + tag + "_" +
                             std::to_string(::getpid()) + ".json";
    std::ofstream(path) << text;
    return path;
  }
} // namespace

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
TEST(config_loader, reads_object) {
  const auto path = writeTemp("ok", R"({"alarm": {"debounce_seconds": 3}})");
  auto doc = ConfigLoader(path).load();
  EXPECT_EQ(doc["alarm"]["debounce_seconds"].get<int>(), 3);
  std::remove(path.c_str());
}

TEST(config_loader, missing_or_broken_file_throws) {
  EXPECT_THROW(ConfigLoader("/nonexistent/zonewatch.json").load(), std::runtime_error);

  const auto broken = writeTemp("broken", "{ \"alarm\": ");
  EXPECT_THROW(ConfigLoader(broken).load(), std::runtime_error);
  std::remove(broken.c_str());

  const auto array = writeTemp("array", "[1, 2, 3]");
  EXPECT_THROW(ConfigLoader(array).load(), std::runtime_error);
  std::remove(array.c_str());
}

// -----------------------------------------------------------------------------
// parseSettings
// -----------------------------------------------------------------------------
TEST(settings, empty_document_gives_defaults) {
  const Settings s = parseSettings(json::object());
  EXPECT_EQ(s.alarm.safeRssiThreshold, -70);
  EXPECT_TRUE(s.alarm.higherRssiIsSafer);
  EXPECT_DOUBLE_EQ(s.alarm.debounceSeconds, 5.0);
  EXPECT_DOUBLE_EQ(s.alarm.commandDelaySeconds, 2.0);
  EXPECT_DOUBLE_EQ(s.alarm.maxSilenceSeconds, 120.0);
  EXPECT_DOUBLE_EQ(s.alarm.watchdogIntervalSeconds, 5.0);
  EXPECT_FALSE(s.alarm.topologyAware);
  EXPECT_EQ(s.alarm.targetDevice, kDefaultAlarmDevice);
  EXPECT_EQ(s.alarm.fport, 10);
  EXPECT_EQ(s.alarm.triggerPrefix, 0xAC);
  EXPECT_FALSE(s.watchlist.autoDiscover);
  EXPECT_EQ(s.watchlist.beacons.size(), 3u);
  EXPECT_EQ(s.watchlist.beacons.count("64AF"), 1u);
  EXPECT_EQ(s.transport.uplinkPath, "-");
  EXPECT_EQ(s.logging.level, LogLevel::Info);
  EXPECT_TRUE(s.display.enabled);
}

TEST(settings, reads_every_section) {
  const json doc = json::parse(R"({
    "alarm": {
      "safe_rssi_threshold": -80, "higher_rssi_is_safer": false, "debounce_seconds": 7,
      "topology_aware": true, "target_device": "a0000000000000ff", "fport": 12,
      "beacon_major": "00ab", "volume_level": 3, "duration_units": 2
    },
    "watchlist": {
      "auto_discover": true,
      "beacons": [ { "id": "64af", "name": "Rosa", "home_floor_id": "floor_1" }, { "id": "1" } ],
      "floors": [ { "id": "floor_1", "name": "First", "macro_sensor_eui": "m1",
                    "bluetooth_gateway_eui": "gw1" } ]
    },
    "transport": { "uplink_path": "/tmp/up", "downlink_path": "/tmp/down", "application_id": "app" },
    "logging": { "file": "events.csv", "level": "debug" },
    "display": { "enabled": false, "refresh_seconds": 2, "stale_seconds": 30 }
  })");

  const Settings s = parseSettings(doc);
  EXPECT_EQ(s.alarm.safeRssiThreshold, -80);
  EXPECT_FALSE(s.alarm.higherRssiIsSafer);
  EXPECT_DOUBLE_EQ(s.alarm.debounceSeconds, 7.0);
  EXPECT_TRUE(s.alarm.topologyAware);
  EXPECT_EQ(s.alarm.fport, 12);
  EXPECT_EQ(s.alarm.beaconMajor, std::optional<std::string>("00AB"));
  EXPECT_EQ(s.alarm.volumeLevel, 3);
  EXPECT_EQ(s.alarm.durationUnits, 2);

  EXPECT_TRUE(s.watchlist.autoDiscover);
  ASSERT_EQ(s.watchlist.beacons.size(), 2u);
  EXPECT_EQ(s.watchlist.beacons.at("64AF").name, "Rosa");
  EXPECT_EQ(s.watchlist.beacons.at("64AF").homeFloorId, std::optional<std::string>("floor_1"));
  EXPECT_EQ(s.watchlist.beacons.at("0001").name, "Beacon 0001");
  ASSERT_EQ(s.watchlist.floors.size(), 1u);
  EXPECT_EQ(s.watchlist.defaultDevice, "a0000000000000ff");

  EXPECT_EQ(s.transport.uplinkPath, "/tmp/up");
  EXPECT_EQ(s.transport.applicationId, "app");
  EXPECT_EQ(s.logging.file, "events.csv");
  EXPECT_EQ(s.logging.level, LogLevel::Debug);
  EXPECT_FALSE(s.display.enabled);
  EXPECT_DOUBLE_EQ(s.display.staleSeconds, 30.0);
}

TEST(settings, beacons_without_floors_get_a_default_floor) {
  const Settings s = parseSettings(json::parse(R"({"watchlist": {"beacons": [{"id": "ABCD"}]}})"));
  ASSERT_EQ(s.watchlist.floors.size(), 1u);
  EXPECT_EQ(s.watchlist.floors[0].macroSensorEui, kDefaultAlarmDevice);
  EXPECT_EQ(s.watchlist.beacons.size(), 1u);
}

TEST(settings, rejects_invalid_values) {
  EXPECT_THROW(parseSettings(json::array()), std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": 5})")), std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"debounce_seconds": -1}})")),
               std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"watchdog_interval_seconds": 0}})")),
               std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"fport": 300}})")), std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"volume_level": 5}})")), std::runtime_error);
  EXPECT_NO_THROW(parseSettings(json::parse(R"({"alarm": {"volume_level": 4}})")));
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"beacon_major": "12345"}})")),
               std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"watchlist": {"beacons": [{"id": "64AG"}]}})")),
               std::runtime_error);
  EXPECT_THROW(parseSettings(json::parse(R"({"watchlist": {"beacons": [{"id": "164AF"}]}})")),
               std::runtime_error);
  // wrong JSON type surfaces as runtime_error, not json::exception
  EXPECT_THROW(parseSettings(json::parse(R"({"alarm": {"debounce_seconds": "soon"}})")),
               std::runtime_error);
}

TEST(settings, parameters_follow_settings) {
  Settings s = Settings::defaults();
  s.alarm.debounceSeconds = 9.0;
  s.display.refreshSeconds = 0.5;
  ParameterStore store;
  storeParameters(s, store);
  EXPECT_DOUBLE_EQ(store.get(Parameter::DebounceSeconds), 9.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::CommandDelaySeconds), 2.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::DisplayRefreshSeconds), 0.5);
}

TEST(parameter_store, fallback_when_unset) {
  ParameterStore store;
  EXPECT_DOUBLE_EQ(store.get(Parameter::MaxSilenceSeconds, 120.0), 120.0);
  store.set(Parameter::MaxSilenceSeconds, 30.0);
  EXPECT_DOUBLE_EQ(store.get(Parameter::MaxSilenceSeconds, 120.0), 30.0);
}

// -----------------------------------------------------------------------------
// Watchlist
// -----------------------------------------------------------------------------
TEST(watchlist, normalizes_ids) {
  EXPECT_EQ(normalizeBeaconId(" 64af "), "64AF");
  EXPECT_EQ(normalizeBeaconId("1"), "0001");
  EXPECT_EQ(minorOf("0001000164af"), "64AF");
  EXPECT_EQ(minorOf("af"), "00AF");
}

TEST(watchlist, resolve_rejects_unknown_unless_auto_discover) {
  Watchlist wl(WatchlistTable::defaults("dev"));
  EXPECT_TRUE(wl.resolve("64af").tracked);
  EXPECT_EQ(wl.resolve("64af").displayName, "Beacon 64AF");

  const auto unknown = wl.resolve("FFFF");
  EXPECT_FALSE(unknown.tracked);
  EXPECT_EQ(wl.size(), 3u);
}

TEST(watchlist, topology_lookups) {
  WatchlistTable t;
  t.beacons.emplace("64AF", BeaconEntry{ "64AF", "Rosa", std::string("floor_1") });
  t.floors.push_back(Floor{ "floor_1", "First", "A0000000000000F1", "24e124fffef00001" });
  t.floors.push_back(Floor{ "floor_2", "", "", "gw2" });
  t.defaultDevice = "dev";
  Watchlist wl(std::move(t));

  EXPECT_EQ(wl.zoneOf("a0000000000000f1"), std::optional<std::string>("floor_1"));
  EXPECT_EQ(wl.zoneOf("24E124FFFEF00001"), std::optional<std::string>("floor_1"));
  EXPECT_FALSE(wl.zoneOf("unknown"));
  EXPECT_FALSE(wl.zoneOf(""));
  EXPECT_EQ(wl.homeZoneOf("64af"), std::optional<std::string>("floor_1"));
  EXPECT_FALSE(wl.homeZoneOf("FFFF"));

  EXPECT_EQ(wl.alarmDeviceFor(std::string("floor_1")), "A0000000000000F1");
  EXPECT_EQ(wl.alarmDeviceFor(std::string("floor_2")), "dev");
  EXPECT_EQ(wl.alarmDeviceFor(std::nullopt), "dev");
  EXPECT_EQ(wl.floorName(std::string("floor_1")), "First");
  EXPECT_EQ(wl.floorName(std::string("floor_2")), "floor_2");
  EXPECT_EQ(wl.floorName(std::nullopt), "Unknown");
}

TEST(watchlist, match_finds_tracked_id_inside_raw_value) {
  Watchlist wl(WatchlistTable::defaults("dev"));
  EXPECT_EQ(wl.match("0001000164ae"), std::optional<std::string>("64AE"));
  EXPECT_FALSE(wl.match("00010001FFFF"));
}

TEST(watchlist, reload_swaps_whole_table) {
  Watchlist wl(WatchlistTable::defaults("dev"));
  auto before = wl.current();

  WatchlistTable next;
  next.beacons.emplace("ABCD", BeaconEntry{ "ABCD", "New", std::nullopt });
  next.defaultDevice = "dev2";
  wl.reload(std::move(next));

  EXPECT_FALSE(wl.resolve("64AF").tracked);
  EXPECT_TRUE(wl.resolve("ABCD").tracked);
  EXPECT_EQ(wl.defaultDevice(), "dev2");
  EXPECT_EQ(before->beacons.size(), 3u); // earlier readers keep their snapshot
}

TEST(watchlist, concurrent_auto_discovery_inserts_once) {
  auto table = WatchlistTable::defaults("dev");
  table.autoDiscover = true;
  Watchlist wl(std::move(table));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i)
    threads.emplace_back([&wl] {
      for (int n = 0; n < 100; ++n)
        wl.resolve("BEEF");
    });
  for (auto& t : threads)
    t.join();

  EXPECT_EQ(wl.size(), 4u);
}
