#pragma once
/** @file  BridgeTransport.hpp
 *  @brief ChirpStack downlink publications written as lines for an MQTT bridge.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <mutex>
#include <string>

// ZoneWatch headers
#include "io/DownlinkTransport.hpp"

namespace zonewatch::io {

  class LineChannel;

  /// Standard base64 (RFC 4648, padded).
  std::string toBase64(const std::vector<std::uint8_t>& bytes);

  /**
 * @class BridgeTransport
 * @brief Emits `<topic> <json>` per downlink, the format `mosquitto_pub -l`
 *        style bridges forward to the broker.
 *
 *  * Topic: `application/<app-id>/device/<eui>/command/down`.
 *  * Body:  `{"devEui","confirmed":false,"fPort","data":<base64>}`.
 *  * The application id is learnt from uplinks at run time.
 */
  class BridgeTransport : public DownlinkTransport {
  public:
    BridgeTransport(std::shared_ptr<LineChannel> channel, std::string applicationId = {});

    void send(const std::string& deviceEui, const std::vector<std::uint8_t>& payload,
              std::uint8_t port) override;

    /// @returns true if the id changed.
    bool setApplicationId(const std::string& applicationId);
    std::string applicationId() const;

    static std::string topicFor(const std::string& applicationId, const std::string& deviceEui);
    static std::string bodyFor(const std::string& deviceEui,
                               const std::vector<std::uint8_t>& payload, std::uint8_t port);

  private:
    std::shared_ptr<LineChannel> channel_;
    mutable std::mutex mtx_;
    std::string applicationId_;
  };

} // namespace zonewatch::io
