#include "api/routes/ZoneRoutes.hpp"

#include "api/Envelope.hpp"
#include "core/ConfigStore.hpp"
#include "model/JsonCodec.hpp"

#include <utility>

using ddns::model::JsonCodec;

namespace ddns::api::routes {

ZoneRoutes::ZoneRoutes(core::ConfigStore& csStore) : _csStore(csStore) {}

ZoneRoutes::~ZoneRoutes() = default;

crow::response ZoneRoutes::list(const std::string& sAccountId) {
  return Envelope::guard("GET /accounts/{id}/zones", [&] {
    JsonCodec::Json jZones = JsonCodec::Json::array();
    for (const auto& zn : _csStore.listZones(sAccountId)) {
      jZones.push_back(JsonCodec::toJson(zn));
    }
    return Envelope::ok({{"zones", std::move(jZones)}}, "Zones retrieved successfully");
  });
}

crow::response ZoneRoutes::create(const std::string& sAccountId, const std::string& sBody) {
  return Envelope::guard("POST /accounts/{id}/zones", [&] {
    auto zn = _csStore.createZone(sAccountId,
                                  JsonCodec::decodeZoneCreate(JsonCodec::parse(sBody)));
    return Envelope::ok({{"zone", JsonCodec::toJson(zn)}}, "Zone created successfully");
  });
}

crow::response ZoneRoutes::get(const std::string& sAccountId, const std::string& sZoneId) {
  return Envelope::guard("GET /accounts/{id}/zones/{zid}", [&] {
    auto zn = _csStore.getZone(sAccountId, sZoneId);
    return Envelope::ok({{"zone", JsonCodec::toJson(zn)}}, "Zone retrieved successfully");
  });
}

crow::response ZoneRoutes::update(const std::string& sAccountId, const std::string& sZoneId,
                                  const std::string& sBody) {
  return Envelope::guard("PUT /accounts/{id}/zones/{zid}", [&] {
    auto zn = _csStore.updateZone(sAccountId, sZoneId,
                                  JsonCodec::decodeZone(JsonCodec::parse(sBody)));
    return Envelope::ok({{"zone", JsonCodec::toJson(zn)}}, "Zone updated successfully");
  });
}

crow::response ZoneRoutes::remove(const std::string& sAccountId, const std::string& sZoneId) {
  return Envelope::guard("DELETE /accounts/{id}/zones/{zid}", [&] {
    _csStore.deleteZone(sAccountId, sZoneId);
    return Envelope::ok(nullptr, "Zone deleted successfully");
  });
}

void ZoneRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /accounts/{id}/zones
  CROW_ROUTE(app, "/accounts/<string>/zones").methods("GET"_method)(
      [this](std::string sAccountId) { return list(sAccountId); });

  // POST /accounts/{id}/zones
  CROW_ROUTE(app, "/accounts/<string>/zones").methods("POST"_method)(
      [this](const crow::request& req, std::string sAccountId) {
        return create(sAccountId, req.body);
      });

  // GET /accounts/{id}/zones/{zid}
  CROW_ROUTE(app, "/accounts/<string>/zones/<string>").methods("GET"_method)(
      [this](std::string sAccountId, std::string sZoneId) { return get(sAccountId, sZoneId); });

  // PUT /accounts/{id}/zones/{zid}
  CROW_ROUTE(app, "/accounts/<string>/zones/<string>").methods("PUT"_method)(
      [this](const crow::request& req, std::string sAccountId, std::string sZoneId) {
        return update(sAccountId, sZoneId, req.body);
      });

  // DELETE /accounts/{id}/zones/{zid}
  CROW_ROUTE(app, "/accounts/<string>/zones/<string>").methods("DELETE"_method)(
      [this](std::string sAccountId, std::string sZoneId) {
        return remove(sAccountId, sZoneId);
      });
}

}  // namespace ddns::api::routes
