#pragma once
/** @file  TerminalDisplay.hpp
 *  @brief Text status panel (one row per beacon) rendered to a stream.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "core/BeaconState.hpp"

namespace zonewatch {
  namespace io {

    /**
 * @class TerminalDisplay
 * @brief Keeps an off-screen frame; `flush()` pushes it in one write.
 *
 *  * Frame = header, one row per `render()` call, footer line.
 *  * ANSI clear-screen only when \p ansi is set (a real terminal).
 */
    class TerminalDisplay {
    public:
      explicit TerminalDisplay(std::ostream& out, bool ansi = false);
      ~TerminalDisplay() = default;

      //---public API---------------------------------------------------------
      void clear(); ///< start a new frame
      void drawText(const std::string& line);

      /// Append the row for one beacon; \p staleSeconds marks unseen beacons "LOST?".
      void render(const core::BeaconSnapshot& beacon, core::TimePoint now, double staleSeconds);

      void flush(); ///< push frame to the stream

      const std::vector<std::string>& frame() const { return lines_; }

      static std::string header();
      static std::string formatRow(const core::BeaconSnapshot& beacon, core::TimePoint now,
                                   double staleSeconds);

      /* non-copyable ------------------------------------------------------- */
      TerminalDisplay(const TerminalDisplay&) = delete;
      TerminalDisplay& operator=(const TerminalDisplay&) = delete;

    private:
      std::ostream& out_;
      bool ansi_;
      bool dirty_{ false };
      std::vector<std::string> lines_;
      std::mutex mtx_;
    };

  } // namespace io
} // namespace zonewatch
