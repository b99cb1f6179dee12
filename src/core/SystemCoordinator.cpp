/* @file SystemCoordinator.cpp
 * @brief daemon life-cycle: wiring, threads, reload
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

// Linux headers
#include <unistd.h>

// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ParameterStore.hpp"
#include "core/PolicyFactory.hpp"
#include "core/Scheduler.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/Watchdog.hpp"
#include "core/Watchlist.hpp"
#include "io/BridgeTransport.hpp"
#include "io/LineChannel.hpp"
#include "io/TerminalDisplay.hpp"
#include "protocols/CommandBuilder.hpp"
#include "protocols/Observation.hpp"
#include "protocols/UplinkDecoder.hpp"
#include "protocols/ZonePolicy.hpp"
#include "ui/UIController.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace zonewatch::core {

  namespace {
    constexpr const char* kSource = "SystemCoordinator";
    constexpr auto kUplinkPoll = std::chrono::milliseconds(200);

    std::shared_ptr<const protocols::ZonePolicy> makePolicy(const AlarmSettings& alarm) {
      return PolicyFactory::withBuiltins().create(PolicyFactory::nameFor(alarm), alarm);
    }

    std::string trim(const std::string& s) {
      const auto b = s.find_first_not_of(" \t\r");
      if (b == std::string::npos)
        return {};
      const auto e = s.find_last_not_of(" \t\r");
      return s.substr(b, e - b + 1);
    }
  } // namespace

  const char* toString(SystemCoordinator::State s) {
    switch (s) {
    case SystemCoordinator::State::BOOT: return "BOOT";
    case SystemCoordinator::State::INIT: return "INIT";
    case SystemCoordinator::State::RUNNING: return "RUNNING";
    case SystemCoordinator::State::STOPPING: return "STOPPING";
    case SystemCoordinator::State::ERROR: return "ERROR";
    }
    return "?";
  }

  SystemCoordinator::SystemCoordinator(std::string configPath)
      : configPath_(std::move(configPath)), logger_(std::make_shared<Logger>()) {}

  SystemCoordinator::~SystemCoordinator() { stop(); }

  SystemCoordinator::State SystemCoordinator::state() const {
    std::lock_guard<std::mutex> lock(stateMtx_);
    return currentState_;
  }

  void SystemCoordinator::transitionTo(State next) {
    State prev;
    {
      std::lock_guard<std::mutex> lock(stateMtx_);
      prev = currentState_;
      currentState_ = next;
    }
    logger_->log(LogLevel::Info, kSource,
                 std::string("state ") + toString(prev) + " -> " + toString(next));
  }

  Settings SystemCoordinator::loadSettings() const {
    try {
      return parseSettings(ConfigLoader(configPath_).load());
    } catch (const std::exception& e) {
      logger_->log(LogLevel::Warn, kSource,
                   std::string(e.what()) + "; using built-in defaults");
      return Settings::defaults();
    }
  }

  // ---------------------------------------------------------------------------
  // initialize
  // ---------------------------------------------------------------------------
  void SystemCoordinator::initialize() {
    if (state() != State::BOOT)
      return;

    settings_ = loadSettings();
    transitionTo(State::INIT);

    logger_->setMinLevel(settings_.logging.level);
    if (!settings_.logging.file.empty() && !logger_->startNewRun(settings_.logging.file))
      logger_->log(LogLevel::Warn, kSource,
                   "cannot open log file " + settings_.logging.file + "; stderr only");

    errorMonitor_ = std::make_shared<ErrorMonitor>();
    errorMonitor_->registerEscalation(
      [logger = logger_](const std::string& msg) { logger->log(LogLevel::Error, "ErrorMonitor", msg); });

    params_ = std::make_shared<ParameterStore>();
    storeParameters(settings_, *params_);

    watchlist_ = std::make_shared<Watchlist>(settings_.watchlist, logger_);
    bus_ = std::make_shared<EventBus>(logger_);
    scheduler_ = std::make_shared<TimerScheduler>(logger_);
    builder_ = std::make_shared<protocols::CommandBuilder>(
      protocols::CommandBuilder::Options{ settings_.alarm.triggerPrefix, settings_.alarm.beaconMajor });

    uplink_ = std::make_shared<io::LineChannel>();
    if (!uplink_->open(settings_.transport.uplinkPath, io::LineChannel::Mode::Read)) {
      handleError("cannot open uplink channel " + settings_.transport.uplinkPath);
      throw std::runtime_error("[SystemCoordinator] uplink channel unavailable: " +
                               settings_.transport.uplinkPath);
    }

    downlink_ = std::make_shared<io::LineChannel>();
    if (!downlink_->open(settings_.transport.downlinkPath, io::LineChannel::Mode::Write))
      errorMonitor_->notifyFailure("[SystemCoordinator] cannot open downlink channel " +
                                   settings_.transport.downlinkPath);
    transport_ = std::make_shared<io::BridgeTransport>(downlink_, settings_.transport.applicationId);

    dispatcher_ = std::make_shared<CommandDispatcher>(
      transport_, scheduler_, builder_, errorMonitor_, logger_, params_,
      CommandDispatcher::Options{ settings_.alarm.fport, settings_.alarm.volumeLevel,
                                  settings_.alarm.durationUnits });

    engine_ = std::make_shared<AlarmEngine>(watchlist_, params_, dispatcher_, bus_, logger_,
                                            makePolicy(settings_.alarm));
    engine_->seedFromWatchlist();

    decoder_ = std::make_shared<protocols::UplinkDecoder>(watchlist_, logger_);
    watchdog_ = std::make_shared<Watchdog>(engine_, params_, logger_);

    if (settings_.display.enabled) {
      // the table must not interleave with downlink lines on stdout
      const bool toStdout = settings_.transport.downlinkPath != "-";
      std::ostream& out = toStdout ? std::cout : std::cerr;
      display_ = std::make_shared<io::TerminalDisplay>(
        out, ::isatty(toStdout ? STDOUT_FILENO : STDERR_FILENO) == 1);
      ui_ = std::make_shared<ui::UIController>(engine_, display_, params_);
    }

    wireEventHandlers();

    std::ostringstream msg;
    msg << "initialised: " << watchlist_->size() << " beacons, policy "
        << PolicyFactory::nameFor(settings_.alarm) << ", target " << settings_.alarm.targetDevice;
    logger_->log(LogLevel::Info, kSource, msg.str());
  }

  void SystemCoordinator::wireEventHandlers() {
    auto logger = logger_;
    auto toCsv = [logger](const char* name) {
      return [logger, name](const BeaconEvent& ev) {
        std::ostringstream os;
        os << name << ' ' << ev.beaconId << " (" << ev.displayName << ") "
           << toString(ev.oldZone) << " -> " << toString(ev.newZone) << " rssi " << ev.rssi
           << " reason " << toString(ev.reason);
        if (!ev.device.empty())
          os << " device " << ev.device;
        logger->log(LogLevel::Info, "EventBus", os.str());
      };
    };
    bus_->subscribe(kStateChangeEvent, toCsv(kStateChangeEvent));
    bus_->subscribe(kAlarmTriggeredEvent, toCsv(kAlarmTriggeredEvent));
    bus_->subscribe(kAlarmSilencedEvent, toCsv(kAlarmSilencedEvent));

    // console notification
    bus_->subscribe(kAlarmTriggeredEvent, [](const BeaconEvent& ev) {
      std::cerr << "*** ALARM: " << ev.displayName << " (" << ev.beaconId << ") "
                << toString(ev.newZone) << ", " << toString(ev.reason) << " ***\n";
    });
    bus_->subscribe(kAlarmSilencedEvent, [](const BeaconEvent& ev) {
      std::cerr << "*** SAFE: " << ev.displayName << " (" << ev.beaconId << ") ***\n";
    });

    if (ui_) {
      auto ui = ui_;
      bus_->subscribe(kStateChangeEvent, [ui](const BeaconEvent& ev) { ui->onEvent(ev); });
    }
    bus_->seal();
  }

  // ---------------------------------------------------------------------------
  // start / stop
  // ---------------------------------------------------------------------------
  void SystemCoordinator::start() {
    if (state() != State::INIT)
      return;
    scheduler_->start();
    watchdog_->start();
    if (ui_)
      ui_->start();

    running_ = true;
    uplinkThread_ = std::thread(&SystemCoordinator::uplinkLoop, this);
    transitionTo(State::RUNNING);
  }

  void SystemCoordinator::stop() {
    const State s = state();
    if (s == State::BOOT || s == State::STOPPING)
      return;
    transitionTo(State::STOPPING);

    running_ = false;
    if (uplinkThread_.joinable())
      uplinkThread_.join();
    if (ui_)
      ui_->stop();
    if (watchdog_)
      watchdog_->stop();
    if (scheduler_)
      scheduler_->stop();
    if (uplink_)
      uplink_->close();
    if (downlink_)
      downlink_->close();

    logger_->log(LogLevel::Info, kSource, "stopped");
    logger_->finishRun();
  }

  void SystemCoordinator::reload() {
    if (!engine_)
      return;
    Settings fresh;
    try {
      fresh = parseSettings(ConfigLoader(configPath_).load());
    } catch (const std::exception& e) {
      logger_->log(LogLevel::Error, kSource,
                   std::string("reload failed, keeping current configuration: ") + e.what());
      return;
    }

    watchlist_->reload(fresh.watchlist);
    storeParameters(fresh, *params_);
    logger_->setMinLevel(fresh.logging.level);
    engine_->setPolicy(makePolicy(fresh.alarm));
    engine_->seedFromWatchlist();
    if (!fresh.transport.applicationId.empty())
      transport_->setApplicationId(fresh.transport.applicationId);

    settings_.alarm = fresh.alarm;
    settings_.watchlist = fresh.watchlist;
    settings_.logging.level = fresh.logging.level;
    logger_->log(LogLevel::Info, kSource,
                 "reloaded " + configPath_ + ": " + std::to_string(watchlist_->size()) + " beacons");
  }

  void SystemCoordinator::handleError(const std::string& reason) {
    logger_->log(LogLevel::Error, kSource, reason);
    transitionTo(State::ERROR);
  }

  // ---------------------------------------------------------------------------
  // uplink feed
  // ---------------------------------------------------------------------------
  void SystemCoordinator::handleUplinkLine(const std::string& line, TimePoint now) {
    const std::string text = trim(line);
    if (text.empty())
      return;

    if (text.front() == '!') {
      std::istringstream in(text.substr(1));
      std::string verb, arg;
      in >> verb >> arg;
      if (verb == "trigger" && !arg.empty())
        manualTrigger(arg);
      else if (verb == "silence")
        manualSilence();
      else if (verb == "unmute")
        manualUnmute();
      else
        logger_->log(LogLevel::Warn, kSource, "unknown control line: " + text);
      return;
    }

    const auto batch = decoder_->decodeLine(text, now);
    if (batch.applicationId && transport_->setApplicationId(*batch.applicationId))
      logger_->log(LogLevel::Info, kSource, "application id " + *batch.applicationId);

    for (const auto& obs : batch.observations)
      engine_->onObservation(obs);
  }

  void SystemCoordinator::uplinkLoop() {
    while (running_) {
      auto line = uplink_->readLine(kUplinkPoll);
      if (!line) {
        if (!uplink_->isOpen()) {
          logger_->log(LogLevel::Warn, kSource, "uplink channel closed");
          break;
        }
        continue;
      }
      handleUplinkLine(*line, Clock::now());
    }
  }

  // ---------------------------------------------------------------------------
  // manual controls
  // ---------------------------------------------------------------------------
  void SystemCoordinator::manualTrigger(const std::string& beaconId) {
    const std::string id = normalizeBeaconId(beaconId);
    logger_->log(LogLevel::Warn, kSource, "manual trigger for " + id);
    dispatcher_->trigger(watchlist_->defaultDevice(), id);
  }

  void SystemCoordinator::manualSilence() {
    logger_->log(LogLevel::Info, kSource, "manual silence");
    dispatcher_->silence(watchlist_->defaultDevice(), {});
  }

  void SystemCoordinator::manualUnmute() {
    logger_->log(LogLevel::Info, kSource, "manual unmute");
    dispatcher_->unmute(watchlist_->defaultDevice());
  }

} // namespace zonewatch::core
