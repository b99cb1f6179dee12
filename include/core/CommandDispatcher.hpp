#pragma once
/** @file  CommandDispatcher.hpp
 *  @brief Paced, per-device downlink queues for the alarm command sequences.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// ZoneWatch headers
#include "core/ErrorMonitor.hpp" // CommandDispatcher is a client to the error monitor
#include "protocols/Command.hpp"

namespace zonewatch::io {
  class DownlinkTransport;
}

namespace zonewatch::protocols {
  class CommandBuilder;
}

namespace zonewatch {
  namespace core {

    class Logger;
    class ParameterStore;
    class Scheduler;

    /**
 * @class CommandDispatcher
 * @brief Turns "silence"/"trigger" decisions into downlinks.
 *
 *  * One FIFO per target device. A trigger is three steps separated by the
 *    command delay (the device drops back-to-back downlinks); a silence or
 *    an unmute is one step. Every step, the last one included, holds its
 *    device for one delay, so a silence requested mid-trigger goes out a
 *    full delay after the search.
 *  * The first step is sent on the caller's thread when the device is idle;
 *    later steps run as Scheduler continuations, so no caller ever sleeps.
 *  * Send failures are logged and reported to the ErrorMonitor; the queue
 *    carries on with the next step.
 */
    class CommandDispatcher : public std::enable_shared_from_this<CommandDispatcher> {
    public:
      struct Options {
        std::uint8_t fport{ 10 };
        std::uint8_t volumeLevel{ 4 };
        std::uint8_t durationUnits{ 6 };
      };

      CommandDispatcher(std::shared_ptr<io::DownlinkTransport> transport,
                        std::shared_ptr<Scheduler> scheduler,
                        std::shared_ptr<protocols::CommandBuilder> builder,
                        std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                        std::shared_ptr<const ParameterStore> params, Options opts);
      ~CommandDispatcher() = default;

      //---public APIs------------------------------------------------------
      void silence(const std::string& device, const std::string& beaconId);
      void unmute(const std::string& device);
      void trigger(const std::string& device, const std::string& beaconId);

      /// Steps still queued for \p device (the one being sent excluded).
      std::size_t pending(const std::string& device) const;

      /// Downlinks handed to the transport / rejected by it since start-up.
      std::uint64_t sentCount() const;
      std::uint64_t failedCount() const;

    private:
      struct Step {
        std::string beaconId;
        std::function<protocols::Command()> build; ///< built at send time (sequence byte)
        std::chrono::milliseconds delayAfter{ 0 };
      };

      struct DeviceQueue {
        std::deque<Step> steps;
        bool busy{ false };
      };

      void enqueue(const std::string& device, std::vector<Step> steps);
      void pump(const std::string& device);
      void sendStep(const std::string& device, const Step& step);
      std::chrono::milliseconds commandDelay() const;

      std::shared_ptr<io::DownlinkTransport> transport_;
      std::shared_ptr<Scheduler> scheduler_;
      std::shared_ptr<protocols::CommandBuilder> builder_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<const ParameterStore> params_;
      Options opts_;

      mutable std::mutex mtx_;
      std::unordered_map<std::string, DeviceQueue> queues_;
      std::uint64_t sent_{ 0 };
      std::uint64_t failed_{ 0 };
      bool lastSendFailed_{ false };
    };

  } // namespace core
} // namespace zonewatch
