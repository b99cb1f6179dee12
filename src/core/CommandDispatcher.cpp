/* @file CommandDispatcher.cpp
 * @brief manages paced, non-blocking downlinks to the alarm devices
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

// ZoneWatch headers
#include "core/CommandDispatcher.hpp"
#include "core/Logger.hpp"
#include "core/ParameterStore.hpp"
#include "core/Scheduler.hpp"
#include "io/DownlinkTransport.hpp"
#include "protocols/CommandBuilder.hpp"

using namespace zonewatch::core;
using zonewatch::protocols::Command;

CommandDispatcher::CommandDispatcher(std::shared_ptr<io::DownlinkTransport> transport,
                                     std::shared_ptr<Scheduler> scheduler,
                                     std::shared_ptr<protocols::CommandBuilder> builder,
                                     std::shared_ptr<ErrorMonitor> errorMonitor,
                                     std::shared_ptr<Logger> logger,
                                     std::shared_ptr<const ParameterStore> params, Options opts)
    : transport_(std::move(transport)), scheduler_(std::move(scheduler)),
      builder_(std::move(builder)), errorMonitor_(std::move(errorMonitor)),
      logger_(std::move(logger)), params_(std::move(params)), opts_(opts) {
  assert(transport_ && "[CommandDispatcher] transport is nullptr");
  assert(scheduler_ && "[CommandDispatcher] scheduler is nullptr");
  assert(builder_ && "[CommandDispatcher] command builder is nullptr");
  assert(errorMonitor_ && "[CommandDispatcher] error monitor is nullptr");
}

std::chrono::milliseconds CommandDispatcher::commandDelay() const {
  const double secs = params_ ? params_->get(Parameter::CommandDelaySeconds, 2.0) : 2.0;
  return std::chrono::milliseconds{ static_cast<long long>(std::llround(secs * 1000.0)) };
}

void CommandDispatcher::silence(const std::string& device, const std::string& beaconId) {
  auto builder = builder_;
  enqueue(device, { Step{ beaconId, [builder] { return builder->mute(); }, commandDelay() } });
}

void CommandDispatcher::unmute(const std::string& device) {
  auto builder = builder_;
  enqueue(device, { Step{ {}, [builder] { return builder->unmute(); }, commandDelay() } });
}

void CommandDispatcher::trigger(const std::string& device, const std::string& beaconId) {
  auto builder = builder_;
  const auto delay = commandDelay();
  const auto volume = opts_.volumeLevel;
  const auto duration = opts_.durationUnits;

  enqueue(device,
          { Step{ beaconId, [builder, volume] { return builder->setVolume(volume); }, delay },
            Step{ beaconId, [builder, duration] { return builder->setDuration(duration); }, delay },
            Step{ beaconId, [builder, beaconId] { return builder->searchBeacon(beaconId); }, delay } });

  if (logger_)
    logger_->log(LogLevel::Warn, "CommandDispatcher",
                 "alarm sequence queued for beacon " + beaconId + " on " + device);
}

std::size_t CommandDispatcher::pending(const std::string& device) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = queues_.find(device);
  return it == queues_.end() ? 0 : it->second.steps.size();
}

std::uint64_t CommandDispatcher::sentCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return sent_;
}

std::uint64_t CommandDispatcher::failedCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return failed_;
}

void CommandDispatcher::enqueue(const std::string& device, std::vector<Step> steps) {
  bool start = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& q = queues_[device];
    for (auto& s : steps)
      q.steps.push_back(std::move(s));
    if (!q.busy) {
      q.busy = true;
      start = true;
    }
  }
  if (start)
    pump(device);
}

void CommandDispatcher::pump(const std::string& device) {
  for (;;) {
    Step step;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto& q = queues_[device];
      if (q.steps.empty()) {
        q.busy = false;
        return;
      }
      step = std::move(q.steps.front());
      q.steps.pop_front();
    }

    // busy flag keeps other threads out of this device's queue while we send
    sendStep(device, step);

    if (step.delayAfter.count() > 0) {
      std::weak_ptr<CommandDispatcher> self = weak_from_this();
      scheduler_->schedule(step.delayAfter, [self, device] {
        if (auto alive = self.lock())
          alive->pump(device);
      });
      return;
    }
  }
}

void CommandDispatcher::sendStep(const std::string& device, const Step& step) {
  try {
    const Command cmd = step.build();
    transport_->send(device, cmd.payload, opts_.fport);

    bool recovered = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++sent_;
      recovered = std::exchange(lastSendFailed_, false);
    }
    if (recovered)
      errorMonitor_->clearSeen();
    if (logger_)
      logger_->log(LogLevel::Info, "CommandDispatcher",
                   std::string(protocols::toString(cmd.kind)) + " " + cmd.toHex() + " -> " + device +
                       " (beacon " + step.beaconId + ")");
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++failed_;
      lastSendFailed_ = true;
    }
    std::string errMsg = std::string("[CommandDispatcher] downlink to ") + device + " failed: " + e.what();
    if (logger_)
      logger_->log(LogLevel::Error, "CommandDispatcher", errMsg);
    errorMonitor_->notifyFailure(errMsg);
  }
}
