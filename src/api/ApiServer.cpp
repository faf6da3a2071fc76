#include "api/ApiServer.hpp"

#include "api/routes/AccountRoutes.hpp"
#include "api/routes/ZoneRoutes.hpp"
#include "common/Logger.hpp"

#include <cstdint>

namespace ddns::api {

ApiServer::ApiServer(routes::AccountRoutes& acrRoutes, routes::ZoneRoutes& zrRoutes)
    : _acrRoutes(acrRoutes), _zrRoutes(zrRoutes) {
  // Request logging goes through spdlog in the handlers
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _acrRoutes.registerRoutes(_app);
  _zrRoutes.registerRoutes(_app);
}

void ApiServer::start(const std::string& sHost, int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on {}:{} ({} threads)", sHost, iPort,
                              iThreads);
  _app.bindaddr(sHost)
      .port(static_cast<std::uint16_t>(iPort))
      .concurrency(static_cast<std::uint16_t>(iThreads))
      .run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace ddns::api
