#pragma once
/** @file  PolicyFactory.hpp
 *  @brief Runtime registry that maps zone-policy names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace zonewatch::protocols {
  class ZonePolicy;
}

namespace zonewatch::core {

  struct AlarmSettings;

  /**
 * @class PolicyFactory
 * @brief Register & instantiate zone policies by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete policies.
 *  * Creators are lambdas returning `unique_ptr<ZonePolicy>`.
 */
  class PolicyFactory {
  public:
    using Creator = std::function<std::unique_ptr<protocols::ZonePolicy>(const AlarmSettings&)>;

    /// Factory pre-loaded with "signal" and "topology".
    static PolicyFactory withBuiltins();

    /// Register a policy under \p name.  Returns false on duplicate.
    bool registerPolicy(const std::string &name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<protocols::ZonePolicy> create(const std::string &name,
                                                  const AlarmSettings &settings) const;

    /// "topology" when the settings ask for floor awareness, else "signal".
    static std::string nameFor(const AlarmSettings &settings);

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace zonewatch::core
