#pragma once

#include <string>

#include <crow.h>

namespace ddns::core {
class ConfigStore;
}

namespace ddns::api::routes {

/// Handlers for /accounts/{id}/zones
/// Class abbreviation: zr
class ZoneRoutes {
 public:
  explicit ZoneRoutes(core::ConfigStore& csStore);
  ~ZoneRoutes();

  /// Register zone routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

  crow::response list(const std::string& sAccountId);
  crow::response create(const std::string& sAccountId, const std::string& sBody);
  crow::response get(const std::string& sAccountId, const std::string& sZoneId);
  crow::response update(const std::string& sAccountId, const std::string& sZoneId,
                        const std::string& sBody);
  crow::response remove(const std::string& sAccountId, const std::string& sZoneId);

 private:
  core::ConfigStore& _csStore;
};

}  // namespace ddns::api::routes
