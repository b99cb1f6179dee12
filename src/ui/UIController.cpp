/* @file UIController.cpp
 * @brief refresh loop between AlarmEngine snapshots and the terminal panel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// ZoneWatch headers
#include "core/AlarmEngine.hpp"
#include "core/EventBus.hpp"
#include "core/ParameterStore.hpp"
#include "io/TerminalDisplay.hpp"
#include "ui/UIController.hpp"

using namespace zonewatch::ui;
using zonewatch::core::Parameter;

UIController::UIController(std::shared_ptr<core::AlarmEngine> engine,
                           std::shared_ptr<io::TerminalDisplay> display,
                           std::shared_ptr<const core::ParameterStore> params, ClockFn clock)
    : engine_(std::move(engine)), display_(std::move(display)), params_(std::move(params)),
      clock_(std::move(clock)) {}

UIController::~UIController() { stop(); }

void UIController::start() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&UIController::workerLoop, this);
}

void UIController::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void UIController::onEvent(const core::BeaconEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    redrawRequested_ = true;
    lastEvent_ = event.displayName + ": " + core::toString(event.oldZone) + " -> " +
                 core::toString(event.newZone);
  }
  cv_.notify_all();
}

void UIController::refresh() {
  const auto now = clock_();
  const double stale = params_ ? params_->get(Parameter::DisplayStaleSeconds, 120.0) : 120.0;

  std::string last;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    last = lastEvent_;
  }

  display_->clear();
  for (const auto& [id, beacon] : engine_->snapshot())
    display_->render(beacon, now, stale);
  if (!last.empty())
    display_->drawText("last change: " + last);
  display_->flush();
}

void UIController::workerLoop() {
  while (running_) {
    refresh();

    const double secs = params_ ? params_->get(Parameter::DisplayRefreshSeconds, 1.0) : 1.0;
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, std::chrono::milliseconds{ static_cast<long long>(secs * 1000.0) },
                 [this] { return !running_ || redrawRequested_; });
    redrawRequested_ = false;
  }
}
