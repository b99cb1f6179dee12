#pragma once
/** @file  DownlinkTransport.hpp
 *  @brief Outbound capability the engine uses to reach field devices.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace zonewatch::io {

  /// A downlink could not be handed to the network.
  class SendError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
 * @class DownlinkTransport
 * @brief Fire-and-forget: success means "handed over", never "delivered".
 */
  class DownlinkTransport {
  public:
    virtual ~DownlinkTransport() = default;

    /// @throws SendError when the payload could not be handed over.
    virtual void send(const std::string& deviceEui, const std::vector<std::uint8_t>& payload,
                      std::uint8_t port) = 0;
  };

} // namespace zonewatch::io
