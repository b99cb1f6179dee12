/* @file ParameterStore.cpp
 * @brief mutex-guarded tunables
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ParameterStore.hpp"

using namespace zonewatch::core;

void ParameterStore::set(Parameter p, double value) {
  std::lock_guard<std::mutex> lock(mtx_);
  values_[p] = value;
}

double ParameterStore::get(Parameter p, double fallback) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = values_.find(p);
  return it == values_.end() ? fallback : it->second;
}
