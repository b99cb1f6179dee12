#pragma once
/** @file  UplinkDecoder.hpp
 *  @brief ChirpStack uplink JSON -> normalised beacon observations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

// ZoneWatch headers
#include "protocols/Observation.hpp"

namespace zonewatch::core {
  class Logger;
  class Watchlist;
} // namespace zonewatch::core

namespace zonewatch::protocols {

  /**
 * @class UplinkDecoder
 * @brief Reads the gateway's pre-decoded `object` (beacon1/rssi1 ...
 *        beacon10/rssi10) plus the `deviceInfo` block.
 *
 *  * Raw ids are matched against the watchlist (substring of a tracked id),
 *    else reduced to their minor and resolved, which may auto-discover.
 *  * Never throws: malformed input gives an empty batch and a Warn line.
 */
  class UplinkDecoder {
  public:
    static constexpr int kMaxSlots = 10;

    explicit UplinkDecoder(std::shared_ptr<core::Watchlist> watchlist,
                           std::shared_ptr<core::Logger> logger = nullptr,
                           bool filterTracked = true);

    UplinkBatch decode(const nlohmann::json& uplink, core::TimePoint now) const;

    /// One text line: a JSON document, optionally prefixed by "<topic> ".
    UplinkBatch decodeLine(const std::string& line, core::TimePoint now) const;

  private:
    void warn(const std::string& message) const;

    std::shared_ptr<core::Watchlist> watchlist_;
    std::shared_ptr<core::Logger> logger_;
    bool filterTracked_;
  };

} // namespace zonewatch::protocols
