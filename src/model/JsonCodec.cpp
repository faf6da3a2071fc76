#include "model/JsonCodec.hpp"

#include "common/Errors.hpp"

#include <climits>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace ddns::model {

namespace {

using Json = JsonCodec::Json;

std::string joinPath(const std::string& sPrefix, const std::string& sSegment) {
  return sPrefix.empty() ? sSegment : sPrefix + " -> " + sSegment;
}

[[noreturn]] void fail(const std::string& sCode, const std::string& sPath,
                       const std::string& sReason) {
  if (sPath.empty()) {
    throw common::ValidationError(sCode, "JSON document " + sReason);
  }
  throw common::ValidationError(sCode, "Field '" + sPath + "': " + sReason);
}

void expectObject(const Json& j, const std::string& sPath,
                  std::initializer_list<std::string_view> ilAllowed) {
  if (!j.is_object()) {
    fail("invalid_field", sPath, "must be an object");
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& sKey = it.key();
    bool bKnown = false;
    for (const auto& svAllowed : ilAllowed) {
      if (sKey == svAllowed) {
        bKnown = true;
        break;
      }
    }
    if (!bKnown) {
      fail("unknown_field", joinPath(sPath, sKey), "unknown field");
    }
  }
}

const Json& required(const Json& j, const char* pKey, const std::string& sPath) {
  auto it = j.find(pKey);
  if (it == j.end()) {
    fail("missing_field", joinPath(sPath, pKey), "field is required");
  }
  return *it;
}

std::string readString(const Json& j, const std::string& sPath) {
  if (!j.is_string()) {
    fail("invalid_field", sPath, "must be a string");
  }
  return j.get<std::string>();
}

bool readBool(const Json& j, const std::string& sPath) {
  if (!j.is_boolean()) {
    fail("invalid_field", sPath, "must be a boolean");
  }
  return j.get<bool>();
}

int readTtl(const Json& j, const std::string& sPath) {
  if (!j.is_number_integer()) {
    fail("invalid_field", sPath, "must be an integer");
  }
  if (j.is_number_unsigned()) {
    const auto uValue = j.get<uint64_t>();
    if (uValue > static_cast<uint64_t>(kMaxTtl)) {
      fail("invalid_field", sPath, "TTL must be between 60 and 86400 seconds");
    }
    return static_cast<int>(uValue);
  }
  const auto iValue = j.get<int64_t>();
  if (iValue < INT_MIN || iValue > INT_MAX) {
    fail("invalid_field", sPath, "TTL must be between 60 and 86400 seconds");
  }
  return static_cast<int>(iValue);
}

std::string readId(const Json& j, const std::string& sPath, JsonCodec::IdField idField) {
  auto it = j.find("id");
  if (it == j.end()) return {};
  if (idField == JsonCodec::IdField::Forbidden) {
    fail("unknown_field", joinPath(sPath, "id"), "unknown field");
  }
  return readString(*it, joinPath(sPath, "id"));
}

const Json& expectArray(const Json& j, const std::string& sPath) {
  if (!j.is_array()) {
    fail("invalid_field", sPath, "must be an array");
  }
  return j;
}

}  // namespace

// ── Decoding ───────────────────────────────────────────────────────────────

Json JsonCodec::parse(const std::string& sBody) {
  try {
    return Json::parse(sBody);
  } catch (const nlohmann::json::parse_error& e) {
    throw common::ValidationError("invalid_json", std::string("Invalid JSON body: ") + e.what());
  }
}

SubDomain JsonCodec::decodeSubDomain(const Json& j, const std::string& sPath, IdField idField) {
  expectObject(j, sPath, {"id", "name", "proxied", "ttl"});

  SubDomain sd;
  sd.sId = readId(j, sPath, idField);
  sd.sName = readString(required(j, "name", sPath), joinPath(sPath, "name"));
  if (auto it = j.find("proxied"); it != j.end()) {
    sd.bProxied = readBool(*it, joinPath(sPath, "proxied"));
  }
  if (auto it = j.find("ttl"); it != j.end()) {
    sd.iTtl = readTtl(*it, joinPath(sPath, "ttl"));
  }
  return sd;
}

Zone JsonCodec::decodeZoneImpl(const Json& j, const std::string& sPath, IdField idField) {
  if (idField == IdField::Forbidden) {
    expectObject(j, sPath, {"zone_id", "domain", "subdomains"});
  } else {
    expectObject(j, sPath, {"id", "zone_id", "domain", "subdomains"});
  }

  Zone zn;
  zn.sId = readId(j, sPath, idField);
  zn.sZoneId = readString(required(j, "zone_id", sPath), joinPath(sPath, "zone_id"));
  zn.sDomain = readString(required(j, "domain", sPath), joinPath(sPath, "domain"));

  if (auto it = j.find("subdomains"); it != j.end()) {
    const std::string sListPath = joinPath(sPath, "subdomains");
    const Json& jList = expectArray(*it, sListPath);
    zn.vSubdomains.reserve(jList.size());
    for (size_t i = 0; i < jList.size(); ++i) {
      zn.vSubdomains.push_back(
          decodeSubDomain(jList[i], joinPath(sListPath, std::to_string(i)), idField));
    }
  }
  return zn;
}

Zone JsonCodec::decodeZoneCreate(const Json& j) {
  return decodeZoneImpl(j, "", IdField::Forbidden);
}

Zone JsonCodec::decodeZone(const Json& j, const std::string& sPath) {
  return decodeZoneImpl(j, sPath, IdField::Optional);
}

Authentication JsonCodec::decodeAuthentication(const Json& j, const std::string& sPath) {
  expectObject(j, sPath, {"api_token", "api_key"});

  Authentication auth;
  if (auto it = j.find("api_token"); it != j.end() && !it->is_null()) {
    auth.oApiToken = readString(*it, joinPath(sPath, "api_token"));
  }
  if (auto it = j.find("api_key"); it != j.end() && !it->is_null()) {
    const std::string sKeyPath = joinPath(sPath, "api_key");
    expectObject(*it, sKeyPath, {"api_key", "account_email"});
    ApiKey ak;
    ak.sApiKey = readString(required(*it, "api_key", sKeyPath), joinPath(sKeyPath, "api_key"));
    ak.sAccountEmail = readString(required(*it, "account_email", sKeyPath),
                                  joinPath(sKeyPath, "account_email"));
    auth.oApiKey = std::move(ak);
  }
  return auth;
}

CloudflareAccount JsonCodec::decodeAccount(const Json& j, const std::string& sPath) {
  expectObject(j, sPath, {"id", "authentication", "zones"});

  CloudflareAccount acct;
  acct.sId = readId(j, sPath, IdField::Optional);
  acct.authentication = decodeAuthentication(required(j, "authentication", sPath),
                                             joinPath(sPath, "authentication"));

  if (auto it = j.find("zones"); it != j.end()) {
    const std::string sListPath = joinPath(sPath, "zones");
    const Json& jList = expectArray(*it, sListPath);
    acct.vZones.reserve(jList.size());
    for (size_t i = 0; i < jList.size(); ++i) {
      acct.vZones.push_back(decodeZone(jList[i], joinPath(sListPath, std::to_string(i))));
    }
  }
  return acct;
}

DdnsConfig JsonCodec::decodeConfig(const Json& j) {
  expectObject(j, "", {"cloudflare", "a", "aaaa", "purgeUnknownRecords", "ttl"});

  DdnsConfig dc;
  if (auto it = j.find("cloudflare"); it != j.end()) {
    const Json& jList = expectArray(*it, "cloudflare");
    dc.vCloudflare.reserve(jList.size());
    for (size_t i = 0; i < jList.size(); ++i) {
      dc.vCloudflare.push_back(
          decodeAccount(jList[i], joinPath("cloudflare", std::to_string(i))));
    }
  }
  if (auto it = j.find("a"); it != j.end()) {
    dc.bA = readBool(*it, "a");
  }
  if (auto it = j.find("aaaa"); it != j.end()) {
    dc.bAaaa = readBool(*it, "aaaa");
  }
  if (auto it = j.find("purgeUnknownRecords"); it != j.end()) {
    dc.bPurgeUnknownRecords = readBool(*it, "purgeUnknownRecords");
  }
  if (auto it = j.find("ttl"); it != j.end()) {
    dc.iTtl = readTtl(*it, "ttl");
  }
  return dc;
}

// ── Encoding ───────────────────────────────────────────────────────────────

Json JsonCodec::toJson(const SubDomain& sdValue) {
  Json j = Json::object();
  j["id"] = sdValue.sId;
  j["name"] = sdValue.sName;
  j["proxied"] = sdValue.bProxied;
  j["ttl"] = sdValue.iTtl;
  return j;
}

Json JsonCodec::toJson(const Zone& znValue) {
  Json j = Json::object();
  j["id"] = znValue.sId;
  j["zone_id"] = znValue.sZoneId;
  j["domain"] = znValue.sDomain;
  j["subdomains"] = Json::array();
  for (const auto& sd : znValue.vSubdomains) {
    j["subdomains"].push_back(toJson(sd));
  }
  return j;
}

Json JsonCodec::toJson(const Authentication& authValue) {
  Json j = Json::object();
  j["api_token"] = authValue.oApiToken ? Json(*authValue.oApiToken) : Json(nullptr);
  if (authValue.oApiKey) {
    Json jKey = Json::object();
    jKey["api_key"] = authValue.oApiKey->sApiKey;
    jKey["account_email"] = authValue.oApiKey->sAccountEmail;
    j["api_key"] = std::move(jKey);
  } else {
    j["api_key"] = nullptr;
  }
  return j;
}

Json JsonCodec::toJson(const CloudflareAccount& acctValue) {
  Json j = Json::object();
  j["id"] = acctValue.sId;
  j["authentication"] = toJson(acctValue.authentication);
  j["zones"] = Json::array();
  for (const auto& zn : acctValue.vZones) {
    j["zones"].push_back(toJson(zn));
  }
  return j;
}

Json JsonCodec::toJson(const DdnsConfig& dcValue) {
  Json j = Json::object();
  j["cloudflare"] = Json::array();
  for (const auto& acct : dcValue.vCloudflare) {
    j["cloudflare"].push_back(toJson(acct));
  }
  j["a"] = dcValue.bA;
  j["aaaa"] = dcValue.bAaaa;
  j["purgeUnknownRecords"] = dcValue.bPurgeUnknownRecords;
  j["ttl"] = dcValue.iTtl;
  return j;
}

}  // namespace ddns::model
