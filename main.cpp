// riskgate — order admission service entry point.
//
//   1) Load the engine configuration (argv[1], default config/riskgate.json).
//   2) Build the AdmissionEngine on the wall clock and start it. With IPC
//      endpoints configured, orders arrive as JSON commands on the REP
//      socket and transitions are broadcast on the PUB socket.
//   3) Idle on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread  → waits for shutdown
//   IPC thread   → IpcServer: commands → AdmissionEngine::executeCommand()
// -----------------------------------------------------------------------------

#include "riskgate/config/config_loader.hpp"
#include "riskgate/engine/admission_engine.hpp"
#include "riskgate/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set from the signal handler; polled by main().
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/riskgate.json";

  riskgate::EngineConfig config;
  try {
    config = riskgate::loadConfigFile(config_path);
  } catch (const riskgate::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  riskgate::LiveTimeProvider clock;

  try {
    riskgate::AdmissionEngine engine(config, clock);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();

    std::cout << "[main] " << config.engine_name << " running with config "
              << config_path << ". Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
