#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "api/routes/AccountRoutes.hpp"
#include "api/routes/ZoneRoutes.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ConfigStore.hpp"
#include "dal/ConfigRepository.hpp"

int main() {
  try {
    // ── Step 1: Load and validate process settings ───────────────────────
    auto cfgApp = ddns::common::Config::load();

    ddns::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = ddns::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (config file: {})", cfgApp.sConfigFile);

    // ── Step 2: Load the managed configuration document ──────────────────
    auto crRepo = std::make_unique<ddns::dal::ConfigRepository>(cfgApp.sConfigFile);
    auto csStore = std::make_unique<ddns::core::ConfigStore>(*crRepo);
    csStore->init();
    spLog->info("Step 2: ConfigStore ready ({} account(s))", csStore->snapshot().vCloudflare.size());

    // ── Step 3: API routes ────────────────────────────────────────────────
    auto acrRoutes = std::make_unique<ddns::api::routes::AccountRoutes>(*csStore);
    auto zrRoutes = std::make_unique<ddns::api::routes::ZoneRoutes>(*csStore);
    auto apiServer = std::make_unique<ddns::api::ApiServer>(*acrRoutes, *zrRoutes);
    apiServer->registerRoutes();
    spLog->info("Step 3: API routes registered");

    // ── Step 4: HTTP server (blocks until SIGINT/SIGTERM) ────────────────
    apiServer->start(cfgApp.sHttpHost, cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("ddns-config-api stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
