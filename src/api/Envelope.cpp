#include "api/Envelope.hpp"

#include <utility>

namespace ddns::api {

crow::response Envelope::make(int iStatus, const Json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response Envelope::ok(Json jData, const std::string& sMessage) {
  Json jBody = Json::object();
  jBody["error"] = false;
  jBody["data"] = std::move(jData);
  jBody["message"] = sMessage;
  return make(200, jBody);
}

crow::response Envelope::fail(const common::AppError& e) {
  Json jBody = Json::object();
  jBody["error"] = true;
  jBody["data"] = Json{{"detail", e.what()}};
  jBody["message"] = e.what();
  return make(e._iHttpStatus, jBody);
}

crow::response Envelope::failInternal(const std::exception& e) {
  Json jBody = Json::object();
  jBody["error"] = true;
  jBody["data"] = Json{{"detail", e.what()}};
  jBody["message"] = "Internal Server Error";
  return make(500, jBody);
}

}  // namespace ddns::api
