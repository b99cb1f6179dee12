/* @file ConfigLoader.cpp
 * @brief reads and parses the JSON configuration file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ZoneWatch headers
#include "core/ConfigLoader.hpp"

using namespace zonewatch::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": top-level value is not an object");
    return doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
