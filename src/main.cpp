/* @file main.cpp
 * @brief zonewatchd entry point
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <string>

// Linux headers
#include <csignal>
#include <pthread.h>

// ZoneWatch headers
#include "core/SystemCoordinator.hpp"

int main(int argc, char** argv) {
  const std::string configPath = argc > 1 ? argv[1] : "zonewatch.json";

  // block before any thread is spawned so every worker inherits the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGHUP);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  zonewatch::core::SystemCoordinator coordinator(configPath);
  try {
    coordinator.initialize();
    coordinator.start();
  } catch (const std::exception& e) {
    std::cerr << "zonewatchd: " << e.what() << '\n';
    coordinator.stop();
    return 1;
  }

  for (;;) {
    int sig = 0;
    if (sigwait(&signals, &sig) != 0)
      break;
    if (sig == SIGHUP) {
      coordinator.reload();
      continue;
    }
    break; // SIGINT / SIGTERM
  }

  coordinator.stop();
  return 0;
}
