/* @file BridgeTransport.cpp
 * @brief formats ChirpStack v4 downlink publications onto a line channel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// 3rd-party headers
#include <mbedtls/base64.h>
#include <nlohmann/json.hpp>

// ZoneWatch headers
#include "io/BridgeTransport.hpp"
#include "io/LineChannel.hpp"

namespace zonewatch::io {

  std::string toBase64(const std::vector<std::uint8_t>& bytes) {
    std::size_t needed = 0;
    // first call only reports the required size (incl. NUL)
    mbedtls_base64_encode(nullptr, 0, &needed, bytes.data(), bytes.size());

    std::vector<unsigned char> buf(needed > 0 ? needed : 1);
    std::size_t written = 0;
    if (mbedtls_base64_encode(buf.data(), buf.size(), &written, bytes.data(), bytes.size()) != 0)
      throw SendError("[BridgeTransport] base64 encoding failed");
    return std::string(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(written));
  }

  BridgeTransport::BridgeTransport(std::shared_ptr<LineChannel> channel, std::string applicationId)
      : channel_(std::move(channel)), applicationId_(std::move(applicationId)) {}

  bool BridgeTransport::setApplicationId(const std::string& applicationId) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (applicationId.empty() || applicationId == applicationId_)
      return false;
    applicationId_ = applicationId;
    return true;
  }

  std::string BridgeTransport::applicationId() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return applicationId_;
  }

  std::string BridgeTransport::topicFor(const std::string& applicationId,
                                        const std::string& deviceEui) {
    return "application/" + applicationId + "/device/" + deviceEui + "/command/down";
  }

  std::string BridgeTransport::bodyFor(const std::string& deviceEui,
                                       const std::vector<std::uint8_t>& payload,
                                       std::uint8_t port) {
    nlohmann::json body = { { "devEui", deviceEui },
                            { "confirmed", false },
                            { "fPort", port },
                            { "data", toBase64(payload) } };
    return body.dump();
  }

  void BridgeTransport::send(const std::string& deviceEui, const std::vector<std::uint8_t>& payload,
                             std::uint8_t port) {
    const std::string appId = applicationId();
    if (appId.empty())
      throw SendError("[BridgeTransport] no application id known yet, dropping downlink to " +
                      deviceEui);
    if (deviceEui.empty())
      throw SendError("[BridgeTransport] no target device configured");
    if (!channel_ || !channel_->isOpen())
      throw SendError("[BridgeTransport] downlink channel is not open");

    const std::string line = topicFor(appId, deviceEui) + " " + bodyFor(deviceEui, payload, port);
    if (!channel_->writeLine(line))
      throw SendError("[BridgeTransport] failed to write downlink for " + deviceEui);
  }

} // namespace zonewatch::io
