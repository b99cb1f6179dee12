// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/EventBus.hpp"
#include "core/ParameterStore.hpp"
#include "core/Watchlist.hpp"
#include "io/TerminalDisplay.hpp"
#include "protocols/CommandBuilder.hpp"
#include "protocols/ZonePolicy.hpp"
#include "ui/UIController.hpp"

// ZoneWatch fakes
#include "FakeDownlinkTransport.hpp"
#include "ManualScheduler.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <thread>

namespace zonewatch::test {

  using namespace zonewatch::core;
  using zonewatch::io::TerminalDisplay;
  using zonewatch::ui::UIController;
  using testing::HasSubstr;

  namespace {
    const TimePoint kT0{ std::chrono::seconds(1'700'000'000) };
  }

  TEST(terminal_display, row_shows_never_seen_beacon) {
    BeaconSnapshot b;
    b.beaconId = "64B0";
    b.displayName = "Beacon 64B0";
    const auto row = TerminalDisplay::formatRow(b, kT0, 120.0);
    EXPECT_THAT(row, HasSubstr("UNKNOWN"));
    EXPECT_THAT(row, HasSubstr("--"));
    EXPECT_THAT(row, HasSubstr("never"));
    EXPECT_THAT(row, HasSubstr("Unknown"));
  }

  TEST(terminal_display, stale_beacon_is_flagged_before_the_watchdog) {
    BeaconSnapshot b;
    b.beaconId = "64AF";
    b.displayName = "Rosa";
    b.zone = Zone::Safe;
    b.rssi = -60;
    b.lastSeen = kT0;
    b.location = "First";

    EXPECT_THAT(TerminalDisplay::formatRow(b, kT0 + std::chrono::seconds(30), 120.0),
                HasSubstr("SAFE"));
    const auto stale = TerminalDisplay::formatRow(b, kT0 + std::chrono::seconds(121), 120.0);
    EXPECT_THAT(stale, HasSubstr("LOST?"));
    EXPECT_THAT(stale, HasSubstr("121s"));

    b.zone = Zone::Lost;
    b.alarmActive = true;
    const auto lost = TerminalDisplay::formatRow(b, kT0 + std::chrono::seconds(300), 120.0);
    EXPECT_THAT(lost, HasSubstr("LOST "));
    EXPECT_THAT(lost, HasSubstr("ON"));
  }

  TEST(terminal_display, flush_writes_frame_once) {
    std::ostringstream out;
    TerminalDisplay display(out);
    display.clear();
    display.drawText("hello");
    display.flush();
    display.flush(); // nothing new
    EXPECT_EQ(out.str(), TerminalDisplay::header() + "\nhello\n");
    ASSERT_EQ(display.frame().size(), 2u);
  }

  class UIControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      params->set(Parameter::DisplayRefreshSeconds, 0.05);
      params->set(Parameter::DisplayStaleSeconds, 120.0);
      auto watchlist = std::make_shared<Watchlist>(WatchlistTable::defaults("dev"));
      auto dispatcher = std::make_shared<CommandDispatcher>(
        std::make_shared<FakeDownlinkTransport>(), std::make_shared<ManualScheduler>(),
        std::make_shared<protocols::CommandBuilder>(),
        std::make_shared<testing::NiceMock<MockErrorMonitor>>(), nullptr, params,
        CommandDispatcher::Options{});
      engine = std::make_shared<AlarmEngine>(watchlist, params, dispatcher, nullptr, nullptr,
                                             std::make_shared<protocols::SignalPolicy>(-70, true));
      engine->seedFromWatchlist();
      display = std::make_shared<TerminalDisplay>(out);
      controller = std::make_shared<UIController>(engine, display, params, [] { return kT0; });
    }

    std::shared_ptr<ParameterStore> params = std::make_shared<ParameterStore>();
    std::shared_ptr<AlarmEngine> engine;
    std::ostringstream out;
    std::shared_ptr<TerminalDisplay> display;
    std::shared_ptr<UIController> controller;
  };

  TEST_F(UIControllerTest, refresh_draws_one_row_per_beacon) {
    engine->onObservation("64AF", -61, std::nullopt, kT0);
    controller->refresh();

    const auto& frame = display->frame();
    ASSERT_EQ(frame.size(), 4u); // header + 3 beacons
    EXPECT_EQ(frame[0], TerminalDisplay::header());
    EXPECT_THAT(frame[1], HasSubstr("64AE"));
    EXPECT_THAT(frame[2], HasSubstr("-61"));
    EXPECT_THAT(frame[2], HasSubstr("SAFE"));
  }

  TEST_F(UIControllerTest, state_change_shows_last_event) {
    BeaconEvent ev;
    ev.displayName = "Beacon 64AF";
    ev.oldZone = Zone::Safe;
    ev.newZone = Zone::Weak;
    controller->onEvent(ev);
    controller->refresh();
    EXPECT_EQ(display->frame().back(), "last change: Beacon 64AF: SAFE -> WEAK");
  }

  TEST_F(UIControllerTest, worker_redraws_until_stopped) {
    controller->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    controller->stop();

    const std::string text = out.str();
    std::size_t frames = 0;
    for (auto pos = text.find("NAME"); pos != std::string::npos; pos = text.find("NAME", pos + 1))
      ++frames;
    EXPECT_GE(frames, 2u);
  }

} // namespace zonewatch::test
