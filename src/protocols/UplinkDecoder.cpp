/* @file UplinkDecoder.cpp
 * @brief normaliser between the LoRaWAN network server and the alarm engine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ZoneWatch headers
#include "core/Logger.hpp"
#include "core/Watchlist.hpp"
#include "protocols/UplinkDecoder.hpp"

namespace zonewatch::protocols {

  namespace {

    std::string toLower(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return s;
    }

    std::optional<std::string> stringAt(const nlohmann::json& obj, const char* key) {
      auto it = obj.find(key);
      if (it == obj.end() || !it->is_string())
        return std::nullopt;
      return it->get<std::string>();
    }

  } // namespace

  UplinkDecoder::UplinkDecoder(std::shared_ptr<core::Watchlist> watchlist,
                               std::shared_ptr<core::Logger> logger, bool filterTracked)
      : watchlist_(std::move(watchlist)), logger_(std::move(logger)), filterTracked_(filterTracked) {}

  void UplinkDecoder::warn(const std::string& message) const {
    if (logger_)
      logger_->log(core::LogLevel::Warn, "UplinkDecoder", message);
  }

  UplinkBatch UplinkDecoder::decode(const nlohmann::json& uplink, core::TimePoint now) const {
    UplinkBatch batch;
    if (!uplink.is_object()) {
      warn("uplink is not a JSON object");
      return batch;
    }

    if (auto info = uplink.find("deviceInfo"); info != uplink.end() && info->is_object()) {
      batch.applicationId = stringAt(*info, "applicationId");
      if (auto eui = stringAt(*info, "devEui"))
        batch.gatewayId = toLower(*eui);
    }

    auto object = uplink.find("object");
    if (object == uplink.end() || !object->is_object())
      return batch; // raw-only frames carry no beacon slots

    for (int i = 1; i <= kMaxSlots; ++i) {
      const std::string beaconKey = "beacon" + std::to_string(i);
      const std::string rssiKey = "rssi" + std::to_string(i);

      auto slot = object->find(beaconKey);
      if (slot == object->end())
        continue;

      try {
        const std::string raw = slot->is_string() ? slot->get<std::string>() : slot->dump();
        const int rssi = object->value(rssiKey, core::kNoRssi);
        if (rssi <= core::kNoRssi)
          continue;

        std::string id;
        if (auto tracked = watchlist_->match(raw)) {
          id = *tracked;
        } else {
          id = core::minorOf(raw);
          if (filterTracked_ && !watchlist_->resolve(id).tracked)
            continue;
        }

        batch.observations.push_back(
            BeaconObservation{ id, rssi, batch.gatewayId, now, core::normalizeBeaconId(raw) });
      } catch (const nlohmann::json::exception& e) {
        warn("skipping " + beaconKey + ": " + e.what());
      }
    }
    return batch;
  }

  UplinkBatch UplinkDecoder::decodeLine(const std::string& line, core::TimePoint now) const {
    // "mosquitto_sub -v" prints "<topic> <payload>"
    auto start = line.find('{');
    if (start == std::string::npos) {
      warn("no JSON object in line: " + line.substr(0, 80));
      return {};
    }

    try {
      return decode(nlohmann::json::parse(line.substr(start)), now);
    } catch (const nlohmann::json::parse_error& e) {
      warn(std::string("malformed uplink: ") + e.what());
      return {};
    }
  }

} // namespace zonewatch::protocols
