#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/Entities.hpp"

namespace ddns::model {

/// Strict JSON <-> entity mapping for request payloads and the config file.
/// Decoding rejects unknown keys, missing required keys and wrong JSON types
/// with common::ValidationError ("Field '<path>': <reason>"). Value
/// constraints (patterns, ranges, uniqueness) are left to Validator.
/// Encoding emits keys in declaration order.
/// Class abbreviation: N/A (static interface)
class JsonCodec {
 public:
  using Json = nlohmann::ordered_json;

  /// Whether an "id" key is accepted in a decoded object.
  /// An absent id decodes to an empty string.
  enum class IdField { Optional, Forbidden };

  /// Parse a request body. Throws ValidationError("invalid_json") on syntax errors.
  static Json parse(const std::string& sBody);

  static SubDomain decodeSubDomain(const Json& j, const std::string& sPath, IdField idField);

  /// POST /zones payload: {zone_id, domain, subdomains}, no ids anywhere.
  static Zone decodeZoneCreate(const Json& j);

  /// Full zone shape; ids optional at every level.
  static Zone decodeZone(const Json& j, const std::string& sPath = "");

  static Authentication decodeAuthentication(const Json& j, const std::string& sPath = "");

  static CloudflareAccount decodeAccount(const Json& j, const std::string& sPath = "");

  static DdnsConfig decodeConfig(const Json& j);

  static Json toJson(const SubDomain& sdValue);
  static Json toJson(const Zone& znValue);
  static Json toJson(const Authentication& authValue);
  static Json toJson(const CloudflareAccount& acctValue);
  static Json toJson(const DdnsConfig& dcValue);

 private:
  static Zone decodeZoneImpl(const Json& j, const std::string& sPath, IdField idField);
};

}  // namespace ddns::model
