/* @file TerminalDisplay.cpp
 * @brief fixed-width beacon status table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iomanip>
#include <sstream>

// ZoneWatch headers
#include "io/TerminalDisplay.hpp"

using namespace zonewatch::io;
using zonewatch::core::BeaconSnapshot;
using zonewatch::core::TimePoint;
using zonewatch::core::Zone;

TerminalDisplay::TerminalDisplay(std::ostream& out, bool ansi) : out_(out), ansi_(ansi) {}

std::string TerminalDisplay::header() {
  std::ostringstream os;
  os << std::left << std::setw(22) << "NAME" << std::setw(8) << "ID" << std::setw(8) << "ZONE"
     << std::setw(7) << "RSSI" << std::setw(9) << "AGE" << std::setw(7) << "ALARM" << "LOCATION";
  return os.str();
}

std::string TerminalDisplay::formatRow(const BeaconSnapshot& b, TimePoint now, double staleSeconds) {
  const bool seen = b.lastSeen != TimePoint{};
  const double age = seen ? core::secondsBetween(b.lastSeen, now) : 0.0;

  std::string zone = core::toString(b.zone);
  if (seen && b.zone != Zone::Lost && age > staleSeconds)
    zone = "LOST?"; // watchdog has not caught up yet

  std::string name = b.displayName.size() > 21 ? b.displayName.substr(0, 21) : b.displayName;

  std::ostringstream os;
  os << std::left << std::setw(22) << name << std::setw(8) << b.beaconId << std::setw(8) << zone
     << std::setw(7) << (b.rssi == core::kNoRssi ? std::string("--") : std::to_string(b.rssi))
     << std::setw(9) << (seen ? std::to_string(static_cast<long>(age)) + "s" : std::string("never"))
     << std::setw(7) << (b.alarmActive ? "ON" : "-") << b.location;
  return os.str();
}

void TerminalDisplay::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  lines_.clear();
  lines_.push_back(header());
  dirty_ = true;
}

void TerminalDisplay::drawText(const std::string& line) {
  std::lock_guard<std::mutex> lock(mtx_);
  lines_.push_back(line);
  dirty_ = true;
}

void TerminalDisplay::render(const BeaconSnapshot& beacon, TimePoint now, double staleSeconds) {
  drawText(formatRow(beacon, now, staleSeconds));
}

void TerminalDisplay::flush() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!dirty_)
    return;

  std::string frame;
  if (ansi_)
    frame += "\x1b[2J\x1b[H";
  for (const auto& l : lines_) {
    frame += l;
    frame += '\n';
  }
  out_ << frame << std::flush;
  dirty_ = false;
}
