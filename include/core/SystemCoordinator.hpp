#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for zonewatch::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/BeaconState.hpp"
#include "core/Settings.hpp"

namespace zonewatch {
  namespace io {
    class BridgeTransport;
    class LineChannel;
    class TerminalDisplay;
  } // namespace io

  namespace protocols {
    class CommandBuilder;
    class UplinkDecoder;
  } // namespace protocols

  namespace ui {
    class UIController;
  }

  namespace core {

    class AlarmEngine;
    class CommandDispatcher;
    class ErrorMonitor;
    class EventBus;
    class Logger;
    class ParameterStore;
    class TimerScheduler;
    class Watchdog;
    class Watchlist;

    /**
 * @class SystemCoordinator
 * @brief Owns every subsystem and the threads that drive them.
 *
 *  BOOT → INIT (`initialize`) → RUNNING (`start`) → STOPPING (`stop`);
 *  ERROR when the uplink feed cannot be opened. A broken config file is not
 *  fatal: the built-in defaults are used instead.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, STOPPING, ERROR };

      explicit SystemCoordinator(std::string configPath);
      ~SystemCoordinator(); ///< stop()

      // ---- Public API ----
      void initialize(); ///< load config, build subsystems, open channels
      void start();      ///< launch scheduler, watchdog, UI and uplink threads
      void stop();       ///< join everything, flush the log last
      void reload();     ///< re-read config; keeps beacon state
      void handleError(const std::string& reason);

      /// One line from the uplink feed: JSON uplink or a `!` control command.
      void handleUplinkLine(const std::string& line, TimePoint now);

      void manualTrigger(const std::string& beaconId);
      void manualSilence();
      void manualUnmute(); ///< re-arm the buzzer after a manual silence

      State state() const;
      std::shared_ptr<AlarmEngine> engine() const { return engine_; }
      const Settings& settings() const { return settings_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);
      Settings loadSettings() const;
      void wireEventHandlers();
      void uplinkLoop();

      std::string configPath_;
      Settings settings_;
      mutable std::mutex stateMtx_;
      State currentState_{ State::BOOT };

      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<ParameterStore> params_;
      std::shared_ptr<Watchlist> watchlist_;
      std::shared_ptr<EventBus> bus_;
      std::shared_ptr<TimerScheduler> scheduler_;
      std::shared_ptr<protocols::CommandBuilder> builder_;
      std::shared_ptr<io::LineChannel> uplink_;
      std::shared_ptr<io::LineChannel> downlink_;
      std::shared_ptr<io::BridgeTransport> transport_;
      std::shared_ptr<CommandDispatcher> dispatcher_;
      std::shared_ptr<AlarmEngine> engine_;
      std::shared_ptr<protocols::UplinkDecoder> decoder_;
      std::shared_ptr<Watchdog> watchdog_;
      std::shared_ptr<io::TerminalDisplay> display_;
      std::shared_ptr<ui::UIController> ui_;

      std::thread uplinkThread_;
      std::atomic<bool> running_{ false };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace zonewatch
