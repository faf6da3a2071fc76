#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ddns::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 422 Unprocessable Entity: malformed payload, unknown field, out-of-range value.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(422, std::move(sCode), std::move(sMsg)) {}
};

/// 400 Bad Request: duplicate credential, zone id or subdomain name.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: unknown account or zone id.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: persistence failure or unexpected fault.
struct InternalError : AppError {
  explicit InternalError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ddns::common
