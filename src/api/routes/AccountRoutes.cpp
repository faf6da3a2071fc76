#include "api/routes/AccountRoutes.hpp"

#include "api/Envelope.hpp"
#include "core/ConfigStore.hpp"
#include "model/JsonCodec.hpp"

#include <utility>

using ddns::model::JsonCodec;

namespace ddns::api::routes {

AccountRoutes::AccountRoutes(core::ConfigStore& csStore) : _csStore(csStore) {}

AccountRoutes::~AccountRoutes() = default;

crow::response AccountRoutes::list() {
  return Envelope::guard("GET /accounts", [&] {
    JsonCodec::Json jAccounts = JsonCodec::Json::array();
    for (const auto& acct : _csStore.listAccounts()) {
      jAccounts.push_back(JsonCodec::toJson(acct));
    }
    return Envelope::ok({{"accounts", std::move(jAccounts)}},
                        "Accounts retrieved successfully");
  });
}

crow::response AccountRoutes::create(const std::string& sBody) {
  return Envelope::guard("POST /accounts", [&] {
    auto acct = _csStore.createAccount(JsonCodec::decodeAccount(JsonCodec::parse(sBody)));
    return Envelope::ok({{"account", JsonCodec::toJson(acct)}}, "Account added successfully");
  });
}

crow::response AccountRoutes::get(const std::string& sAccountId) {
  return Envelope::guard("GET /accounts/{id}", [&] {
    auto acct = _csStore.getAccount(sAccountId);
    return Envelope::ok({{"account", JsonCodec::toJson(acct)}},
                        "Account retrieved successfully");
  });
}

crow::response AccountRoutes::update(const std::string& sAccountId, const std::string& sBody) {
  return Envelope::guard("PUT /accounts/{id}", [&] {
    auto acct = _csStore.updateAccount(sAccountId,
                                       JsonCodec::decodeAccount(JsonCodec::parse(sBody)));
    return Envelope::ok({{"account", JsonCodec::toJson(acct)}}, "Account updated successfully");
  });
}

crow::response AccountRoutes::remove(const std::string& sAccountId) {
  return Envelope::guard("DELETE /accounts/{id}", [&] {
    _csStore.deleteAccount(sAccountId);
    return Envelope::ok(nullptr, "Account deleted successfully");
  });
}

crow::response AccountRoutes::updateAuthentication(const std::string& sAccountId,
                                                   const std::string& sBody) {
  return Envelope::guard("PUT /accounts/{id}/auth", [&] {
    auto auth = _csStore.updateAuthentication(
        sAccountId, JsonCodec::decodeAuthentication(JsonCodec::parse(sBody)));
    return Envelope::ok({{"auth", JsonCodec::toJson(auth)}},
                        "Authentication updated successfully");
  });
}

void AccountRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /accounts
  CROW_ROUTE(app, "/accounts").methods("GET"_method)([this]() { return list(); });

  // POST /accounts
  CROW_ROUTE(app, "/accounts").methods("POST"_method)(
      [this](const crow::request& req) { return create(req.body); });

  // GET /accounts/{id}
  CROW_ROUTE(app, "/accounts/<string>").methods("GET"_method)(
      [this](std::string sAccountId) { return get(sAccountId); });

  // PUT /accounts/{id}
  CROW_ROUTE(app, "/accounts/<string>").methods("PUT"_method)(
      [this](const crow::request& req, std::string sAccountId) {
        return update(sAccountId, req.body);
      });

  // DELETE /accounts/{id}
  CROW_ROUTE(app, "/accounts/<string>").methods("DELETE"_method)(
      [this](std::string sAccountId) { return remove(sAccountId); });

  // PUT /accounts/{id}/auth
  CROW_ROUTE(app, "/accounts/<string>/auth").methods("PUT"_method)(
      [this](const crow::request& req, std::string sAccountId) {
        return updateAuthentication(sAccountId, req.body);
      });
}

}  // namespace ddns::api::routes
