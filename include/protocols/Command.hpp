#pragma once
/** @file  Command.hpp
 *  @brief One downlink command for the alarm device (Lansitec-style hex frames).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

namespace zonewatch {
  namespace protocols {

    enum class CommandKind : std::uint8_t { Mute, Unmute, SetVolume, SetDuration, SearchBeacon };

    inline const char* toString(CommandKind k) {
      switch (k) {
      case CommandKind::Mute:
        return "MUTE";
      case CommandKind::Unmute:
        return "UNMUTE";
      case CommandKind::SetVolume:
        return "SET_VOLUME";
      case CommandKind::SetDuration:
        return "SET_DURATION";
      case CommandKind::SearchBeacon:
        return "SEARCH_BEACON";
      default:
        return "UNKNOWN";
      }
    }

    struct Command {
      CommandKind kind{ CommandKind::Mute };
      std::vector<std::uint8_t> payload;

      /// Upper-case hex, e.g. "B0000100".
      std::string toHex() const {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(payload.size() * 2);
        for (std::uint8_t b : payload) {
          out += digits[b >> 4];
          out += digits[b & 0x0F];
        }
        return out;
      }
    };

  } // namespace protocols
} // namespace zonewatch
