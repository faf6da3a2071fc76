#pragma once

#include <string>

#include <crow.h>

namespace ddns::core {
class ConfigStore;
}

namespace ddns::api::routes {

/// Handlers for /accounts and /accounts/{id}/auth.
/// Each handler returns the full envelope response; registerRoutes binds them.
/// Class abbreviation: acr
class AccountRoutes {
 public:
  explicit AccountRoutes(core::ConfigStore& csStore);
  ~AccountRoutes();

  /// Register account routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

  crow::response list();
  crow::response create(const std::string& sBody);
  crow::response get(const std::string& sAccountId);
  crow::response update(const std::string& sAccountId, const std::string& sBody);
  crow::response remove(const std::string& sAccountId);
  crow::response updateAuthentication(const std::string& sAccountId, const std::string& sBody);

 private:
  core::ConfigStore& _csStore;
};

}  // namespace ddns::api::routes
