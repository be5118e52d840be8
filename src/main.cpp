/* @file main.cpp
 * @brief entry point: load settings, pick the hardware link, run the coordinator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "ai/GeminiClient.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "core/Settings.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/RpcHardwareLink.hpp"
#include "io/SimulatedHardwareLink.hpp"

using namespace genesis;

namespace {
  constexpr const char* kTag = "main";
  constexpr const char* kDefaultConfig = "config/genesis.json";

  std::atomic<bool> gStopRequested{ false };

  void onSignal(int) { gStopRequested = true; }

  void usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--simulate] [config.json]\n"
              << "  --simulate   run against the in-process robot, read utterances from stdin\n";
  }

  // Lines typed on stdin become recognised utterances. Detached: getline cannot be interrupted.
  void startConsoleFeed(std::shared_ptr<io::SimulatedHardwareLink> sim,
                        std::shared_ptr<core::Logger> logger) {
    std::thread([sim, logger] {
      std::string line;
      while (!gStopRequested.load() && std::getline(std::cin, line)) {
        if (!line.empty())
          sim->injectUtterance(line);
      }
      logger->debug(kTag, "console feed closed");
    }).detach();
  }
} // namespace

int main(int argc, char** argv) {
  std::string configPath = kDefaultConfig;
  bool forceSimulation = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--simulate") == 0) {
      forceSimulation = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage(argv[0]);
      return 0;
    } else {
      configPath = argv[i];
    }
  }

  auto logger = std::make_shared<core::Logger>();

  core::Settings settings;
  try {
    settings = core::Settings::fromJson(core::ConfigLoader(configPath).load());
    settings.applyEnvironment();
  } catch (const std::exception& e) {
    logger->critical(kTag, std::string("configuration rejected: ") + e.what());
    return 1;
  }
  if (forceSimulation)
    settings.simulateHardware = true;

  logger->setThreshold(settings.logLevel);
  if (!logger->startNewRun(settings.logFilePath()))
    logger->warn(kTag, "cannot open " + settings.logFilePath() + ", logging to console only");

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    logger->critical(kTag, "libcurl initialisation failed");
    logger->finishRun();
    return 1;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  core::SystemCoordinator::Dependencies deps;
  std::shared_ptr<io::SimulatedHardwareLink> simulated;
  if (settings.simulateHardware) {
    simulated = std::make_shared<io::SimulatedHardwareLink>(logger);
    for (const auto& phrase : settings.simulatedPhrases)
      simulated->injectUtterance(phrase);
    deps.link = simulated;
    logger->info(kTag, "hardware simulation on");
  } else {
    deps.link = std::make_shared<io::RpcHardwareLink>(logger);
  }

  if (settings.reasoningApiKey.empty()) {
    logger->warn(kTag, "no reasoning API key, external reasoning disabled");
  } else {
    ai::GeminiClient::Config cfg;
    cfg.apiKey = settings.reasoningApiKey;
    cfg.model = settings.reasoningModel;
    cfg.timeout = settings.reasoningTimeout;
    try {
      deps.modelClient = std::make_shared<ai::GeminiClient>(std::move(cfg), logger);
    } catch (const std::invalid_argument& e) {
      logger->error(kTag, std::string("reasoning client rejected: ") + e.what());
    }
  }

  int rc = 0;
  try {
    core::SystemCoordinator coordinator(settings, logger, std::move(deps));
    if (coordinator.initialize()) {
      if (simulated)
        startConsoleFeed(simulated, logger);
      coordinator.run(gStopRequested);
    } else {
      logger->critical(kTag, "start-up failed");
      rc = 1;
    }
    coordinator.shutdown();
  } catch (const std::exception& e) {
    logger->critical(kTag, std::string("fatal: ") + e.what());
    rc = 1;
  }

  curl_global_cleanup();
  logger->info(kTag, "bye");
  logger->finishRun();
  return rc;
}
