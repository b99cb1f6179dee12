#pragma once
/** @file  CommandBuilder.hpp
 *  @brief Maps logical alarm commands to device payload bytes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ZoneWatch headers
#include "protocols/Command.hpp"

namespace zonewatch::protocols {

  /// "B0000100" -> {0xB0,0x00,0x01,0x00}; throws std::invalid_argument on odd length / non-hex.
  std::vector<std::uint8_t> hexToBytes(std::string_view hex);

  /**
 * @class CommandBuilder
 * @brief Stateless apart from the rolling message id of search commands.
 *
 *  Config frames are `B0 <msgid 00> <param> <value>`:
 *    * param 01 = buzzer volume (0 mutes, 4 is loudest)
 *    * param 02 = buzzer duration in 10 s units
 *
 *  Search frames are `<prefix> <seq> [major] <minor>`; `seq` increments on
 *  every call and wraps 255 -> 0. Devices drop identical back-to-back
 *  frames, so this is what makes a re-trigger audible.
 */
  class CommandBuilder {
  public:
    static constexpr std::uint8_t kConfigType = 0xB0;
    static constexpr std::uint8_t kParamVolume = 0x01;
    static constexpr std::uint8_t kParamDuration = 0x02;
    static constexpr std::uint8_t kMaxVolume = 4;

    struct Options {
      std::uint8_t triggerPrefix{ 0xAC };
      std::optional<std::string> beaconMajor;
    };

    CommandBuilder() = default;
    explicit CommandBuilder(Options opts);

    Command mute() const;
    Command unmute() const;
    Command setVolume(std::uint8_t level) const;
    Command setDuration(std::uint8_t tensOfSeconds) const;

    /// @throws std::invalid_argument if \p beaconId is not hex.
    Command searchBeacon(const std::string& beaconId);

    /// Sequence byte the next search command will carry.
    std::uint8_t nextSequence() const { return sequence_.load(); }

  private:
    Command config(CommandKind kind, std::uint8_t param, std::uint8_t value) const;

    Options opts_{};
    std::atomic<std::uint8_t> sequence_{ 0 };
  };

} // namespace zonewatch::protocols
