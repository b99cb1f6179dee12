/* @file CommandBuilder.cpp
 * @brief byte layouts of the alarm device's config and search frames
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <stdexcept>

// ZoneWatch headers
#include "core/Watchlist.hpp"
#include "protocols/CommandBuilder.hpp"

namespace zonewatch::protocols {

  std::vector<std::uint8_t> hexToBytes(std::string_view hex) {
    auto nibble = [hex](char c) -> std::uint8_t {
      if (c >= '0' && c <= '9')
        return static_cast<std::uint8_t>(c - '0');
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      if (c >= 'A' && c <= 'F')
        return static_cast<std::uint8_t>(c - 'A' + 10);
      throw std::invalid_argument("[CommandBuilder] not a hex string: " + std::string(hex));
    };

    if (hex.size() % 2 != 0)
      throw std::invalid_argument("[CommandBuilder] odd-length hex string: " + std::string(hex));

    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2)
      out.push_back(static_cast<std::uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    return out;
  }

  CommandBuilder::CommandBuilder(Options opts) : opts_(std::move(opts)) {
    if (opts_.beaconMajor)
      hexToBytes(*opts_.beaconMajor); // validate once, up front
  }

  Command CommandBuilder::config(CommandKind kind, std::uint8_t param, std::uint8_t value) const {
    return Command{ kind, { kConfigType, 0x00, param, value } };
  }

  Command CommandBuilder::mute() const { return config(CommandKind::Mute, kParamVolume, 0x00); }

  Command CommandBuilder::unmute() const { return config(CommandKind::Unmute, kParamVolume, 0x01); }

  Command CommandBuilder::setVolume(std::uint8_t level) const {
    if (level > kMaxVolume)
      throw std::invalid_argument("[CommandBuilder] volume level " + std::to_string(level) +
                                  " out of range 0-4");
    return config(CommandKind::SetVolume, kParamVolume, level);
  }

  Command CommandBuilder::setDuration(std::uint8_t tensOfSeconds) const {
    return config(CommandKind::SetDuration, kParamDuration, tensOfSeconds);
  }

  Command CommandBuilder::searchBeacon(const std::string& beaconId) {
    const auto minor = hexToBytes(core::minorOf(beaconId));

    Command cmd{ CommandKind::SearchBeacon, { opts_.triggerPrefix } };
    cmd.payload.push_back(sequence_.fetch_add(1)); // uint8_t wraps 255 -> 0
    if (opts_.beaconMajor) {
      const auto major = hexToBytes(*opts_.beaconMajor);
      cmd.payload.insert(cmd.payload.end(), major.begin(), major.end());
    }
    cmd.payload.insert(cmd.payload.end(), minor.begin(), minor.end());
    return cmd;
  }

} // namespace zonewatch::protocols
