#pragma once
/** @file  UIController.hpp
 *  @brief Status-panel controller (runs its own refresh thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/BeaconState.hpp"

namespace zonewatch {
  namespace core { // forward decls so we don’t pull core headers in
    class AlarmEngine;
    class ParameterStore;
    struct BeaconEvent;
  } // namespace core

  namespace io {
    class TerminalDisplay;
  }

  namespace ui {

    /**
 * @class UIController
 * @brief Pulls engine snapshots and pushes one row per beacon to the display.
 *
 * * Redraws every DisplayRefreshSeconds, and right away after a state event.
 * * `onEvent()` only flags the frame dirty; drawing happens on the UI thread,
 *   so the engine never waits for the terminal.
 */
    class UIController {

    public:
      using ClockFn = std::function<core::TimePoint()>;

      UIController(std::shared_ptr<core::AlarmEngine> engine,
                   std::shared_ptr<io::TerminalDisplay> display,
                   std::shared_ptr<const core::ParameterStore> params,
                   ClockFn clock = &core::Clock::now);
      ~UIController(); ///< stop()

      // ---- public API ----------------------------------------------------------
      void start(); ///< launch background worker thread (pull + draw)
      void stop();

      /// Event-bus subscriber: request an immediate redraw.
      void onEvent(const core::BeaconEvent& event);

      /// Draw one frame now (also used by the worker).
      void refresh();

      UIController(const UIController&) = delete;
      UIController& operator=(const UIController&) = delete;

    private:
      void workerLoop();

      std::shared_ptr<core::AlarmEngine> engine_;
      std::shared_ptr<io::TerminalDisplay> display_;
      std::shared_ptr<const core::ParameterStore> params_;
      ClockFn clock_;

      std::thread worker_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::atomic<bool> running_{ false };
      bool redrawRequested_{ false };
      std::string lastEvent_;
    };

  } // namespace ui
} // namespace zonewatch
