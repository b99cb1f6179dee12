#pragma once
/** @file  ParameterStore.hpp
 *  @brief Thread-safe runtime tunables shared by the engine, watchdog and UI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <unordered_map>

namespace zonewatch {
  namespace core {

    /**
 * @enum Parameter
 * @brief Strong-typed keys for every tunable that may change on reload.
 */
    enum class Parameter {
      DebounceSeconds,
      CommandDelaySeconds,
      MaxSilenceSeconds,
      WatchdogIntervalSeconds,
      DisplayRefreshSeconds,
      DisplayStaleSeconds,
    };

    /** @class ParameterStore
 *  @brief Lock-protected map of <Parameter → double>.
 *
 *  * Written by the coordinator on start-up and on SIGHUP, read from the
 *    uplink, watchdog and UI threads.
 *  * Uses strong-typed key to avoid accidental string mismatches.
 */
    class ParameterStore {

    public:
      ParameterStore() = default;
      ~ParameterStore() = default;

      /// Atomically writes \p value under key \p p.
      void set(Parameter p, double value);

      /// Thread-safe getter; returns \p fallback if key missing.
      double get(Parameter p, double fallback = 0.0) const;

    private:
      mutable std::mutex mtx_;
      std::unordered_map<Parameter, double> values_;
    };

  } // namespace core
} // namespace zonewatch
