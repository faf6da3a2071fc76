#pragma once

#include <exception>
#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace ddns::api {

/// Uniform response body {"error", "data", "message"} for every endpoint.
/// Class abbreviation: N/A (static interface)
class Envelope {
 public:
  using Json = nlohmann::ordered_json;

  static crow::response ok(Json jData, const std::string& sMessage);

  /// Status from the error; data.detail and message carry its text.
  static crow::response fail(const common::AppError& e);

  /// 500 for anything that is not an AppError.
  static crow::response failInternal(const std::exception& e);

  /// Run fnHandler and map any exception it throws into an error envelope.
  template <typename Fn>
  static crow::response guard(const char* pRoute, Fn&& fnHandler) {
    try {
      return fnHandler();
    } catch (const common::AppError& e) {
      if (e._iHttpStatus >= 500) {
        common::Logger::get()->error("{}: {} ({})", pRoute, e.what(), e._sErrorCode);
      } else {
        common::Logger::get()->warn("{}: {} ({})", pRoute, e.what(), e._sErrorCode);
      }
      return fail(e);
    } catch (const std::exception& e) {
      common::Logger::get()->error("{}: unexpected failure: {}", pRoute, e.what());
      return failInternal(e);
    }
  }

 private:
  static crow::response make(int iStatus, const Json& jBody);
};

}  // namespace ddns::api
