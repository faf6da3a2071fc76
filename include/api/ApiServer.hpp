#pragma once

#include <string>

#include <crow.h>

namespace ddns::api::routes {
class AccountRoutes;
class ZoneRoutes;
}  // namespace ddns::api::routes

namespace ddns::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(routes::AccountRoutes& acrRoutes, routes::ZoneRoutes& zrRoutes);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or SIGINT/SIGTERM is received.
  void start(const std::string& sHost, int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::AccountRoutes& _acrRoutes;
  routes::ZoneRoutes& _zrRoutes;
};

}  // namespace ddns::api
