// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/SystemCoordinator.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace zonewatch::test {

  using zonewatch::core::SystemCoordinator;
  using zonewatch::core::Zone;
  using testing::HasSubstr;

  namespace {
    const core::TimePoint kT0{ std::chrono::seconds(1'700'000'000) };

    std::string uplinkFor(const std::string& beacon, int rssi) {
      std::ostringstream os;
      os << R"({"deviceInfo":{"applicationId":"app-9","devEui":"24e124fffef00001"},)"
         << R"("object":{"beacon1":")" << beacon << R"(","rssi1":)" << rssi << "}}";
      return os.str();
    }
  } // namespace

  class SystemCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      const std::string base = std::string(::testing::TempDir()) + "zonewatch_coord_" +
                               std::to_string(::getpid()) + "_";
      configPath = base + "config.json";
      uplinkPath = base + "uplink.jsonl";
      downlinkPath = base + "downlink.txt";
      std::remove(downlinkPath.c_str());
      std::ofstream(uplinkPath).close();
      writeConfig(R"([ { "id": "64AF", "name": "Rosa" } ])");
    }

    void TearDown() override {
      std::remove(configPath.c_str());
      std::remove(uplinkPath.c_str());
      std::remove(downlinkPath.c_str());
    }

    void writeConfig(const std::string& beacons, const std::string& uplink = {},
                     double commandDelay = 2.0) {
      std::ofstream out(configPath);
      out << R"({ "alarm": { "debounce_seconds": 5, "target_device": "a0000000000000aa", )"
          << R"("command_delay_seconds": )" << commandDelay << " },"
          << R"( "watchlist": { "beacons": )" << beacons << " },"
          << R"( "transport": { "uplink_path": ")" << (uplink.empty() ? uplinkPath : uplink)
          << R"(", "downlink_path": ")" << downlinkPath << R"(" },)"
          << R"( "display": { "enabled": false } })";
    }

    std::vector<std::string> downlinkLines() const {
      std::ifstream in(downlinkPath);
      std::vector<std::string> lines;
      for (std::string line; std::getline(in, line);)
        lines.push_back(line);
      return lines;
    }

    std::string configPath, uplinkPath, downlinkPath;
  };

  TEST_F(SystemCoordinatorTest, initialise_builds_engine_from_config) {
    SystemCoordinator coordinator(configPath);
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::BOOT);
    coordinator.initialize();
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::INIT);

    auto snap = coordinator.engine()->snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap.at("64AF").displayName, "Rosa");
    EXPECT_EQ(coordinator.settings().alarm.targetDevice, "a0000000000000aa");
  }

  TEST_F(SystemCoordinatorTest, uplink_line_reaches_engine_and_downlink) {
    SystemCoordinator coordinator(configPath);
    coordinator.initialize();

    coordinator.handleUplinkLine(uplinkFor("0001000164AF", -60), kT0);

    EXPECT_EQ(coordinator.engine()->snapshotOf("64AF")->zone, Zone::Safe);
    const auto lines = downlinkLines();
    ASSERT_EQ(lines.size(), 1u); // startup mute
    EXPECT_THAT(lines[0], HasSubstr("application/app-9/device/a0000000000000aa/command/down "));
    EXPECT_THAT(lines[0], HasSubstr(R"("data":"sAABAA==")"));
  }

  TEST_F(SystemCoordinatorTest, control_lines_drive_manual_commands) {
    writeConfig(R"([ { "id": "64AF", "name": "Rosa" } ])", {}, 0.0); // no pacing, no scheduler thread
    SystemCoordinator coordinator(configPath);
    coordinator.initialize();
    coordinator.handleUplinkLine(uplinkFor("64AF", -60), kT0); // learn the application id

    coordinator.handleUplinkLine("!silence", kT0);
    coordinator.handleUplinkLine("  !trigger 64af ", kT0);
    coordinator.handleUplinkLine("!unmute", kT0);
    coordinator.handleUplinkLine("!dance", kT0);

    const auto lines = downlinkLines();
    ASSERT_EQ(lines.size(), 6u); // mute, mute, volume, duration, search, unmute
    EXPECT_THAT(lines[1], HasSubstr("sAABAA=="));
    EXPECT_THAT(lines[2], HasSubstr("sAABBA==")); // B0000104: volume loudest
    EXPECT_THAT(lines[4], HasSubstr("rABkrw==")); // AC0064AF
    EXPECT_THAT(lines[5], HasSubstr("sAABAQ==")); // B0000101
  }

  TEST_F(SystemCoordinatorTest, missing_config_falls_back_to_defaults) {
    std::remove(configPath.c_str());
    SystemCoordinator coordinator(configPath);
    coordinator.initialize(); // stdin / stdout channels

    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::INIT);
    EXPECT_EQ(coordinator.settings().transport.uplinkPath, "-");
    EXPECT_EQ(coordinator.engine()->snapshot().size(), 3u);
    EXPECT_TRUE(coordinator.engine()->snapshotOf("64B0"));
  }

  TEST_F(SystemCoordinatorTest, unopenable_uplink_is_fatal) {
    writeConfig(R"([ { "id": "64AF" } ])", "/nonexistent-dir/uplink");
    SystemCoordinator coordinator(configPath);
    EXPECT_THROW(coordinator.initialize(), std::runtime_error);
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::ERROR);
  }

  TEST_F(SystemCoordinatorTest, reload_swaps_watchlist_and_keeps_state) {
    SystemCoordinator coordinator(configPath);
    coordinator.initialize();
    coordinator.handleUplinkLine(uplinkFor("64AF", -60), kT0);

    writeConfig(R"([ { "id": "64AF", "name": "Rosa M." }, { "id": "ABCD", "name": "Noah" } ])");
    coordinator.reload();

    auto snap = coordinator.engine()->snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap.at("64AF").zone, Zone::Safe); // state survived
    EXPECT_EQ(snap.at("ABCD").zone, Zone::Unknown);

    std::ofstream(configPath) << "{ broken";
    coordinator.reload();
    EXPECT_EQ(coordinator.engine()->snapshot().size(), 2u);
  }

  TEST_F(SystemCoordinatorTest, running_daemon_consumes_uplink_feed) {
    {
      std::ofstream out(uplinkPath);
      out << "application/app-9/device/24e124fffef00001/event/up " << uplinkFor("64AF", -60) << "\n"
          << "garbage line\n";
    }

    SystemCoordinator coordinator(configPath);
    coordinator.initialize();
    coordinator.start();
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::RUNNING);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (coordinator.engine()->snapshotOf("64AF")->zone == Zone::Unknown &&
           std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));

    coordinator.stop();
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::STOPPING);
    EXPECT_EQ(coordinator.engine()->snapshotOf("64AF")->zone, Zone::Safe);
  }

} // namespace zonewatch::test
