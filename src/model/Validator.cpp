#include "model/Validator.hpp"

#include <set>
#include <utility>

namespace ddns::model {

namespace {

bool isAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isValidLabel(const std::string& sLabel) {
  if (sLabel.empty()) return false;
  if (!isAlnum(sLabel.front()) || !isAlnum(sLabel.back())) return false;
  for (char c : sLabel) {
    if (!isAlnum(c) && c != '-') return false;
  }
  return true;
}

ValidationIssue invalid(std::string sField, std::string sMessage) {
  return ValidationIssue{ValidationIssue::Kind::Invalid, "invalid_field", std::move(sField),
                         std::move(sMessage)};
}

ValidationIssue duplicate(std::string sCode, std::string sField, std::string sMessage) {
  return ValidationIssue{ValidationIssue::Kind::Duplicate, std::move(sCode), std::move(sField),
                         std::move(sMessage)};
}

}  // namespace

std::string ValidationIssue::describe() const {
  if (kind == Kind::Invalid && !sField.empty()) {
    return "Field '" + sField + "': " + sMessage;
  }
  return sMessage;
}

std::string Validator::joinPath(const std::string& sPrefix, const std::string& sSegment) {
  return sPrefix.empty() ? sSegment : sPrefix + " -> " + sSegment;
}

bool Validator::isValidSubdomainName(const std::string& sName) {
  if (sName == "@") return true;
  if (sName.empty() || sName.size() > kMaxSubdomainNameLen) return false;

  size_t nStart = 0;
  while (true) {
    const size_t nDot = sName.find('.', nStart);
    const std::string sLabel =
        sName.substr(nStart, nDot == std::string::npos ? std::string::npos : nDot - nStart);
    if (!isValidLabel(sLabel)) return false;
    if (nDot == std::string::npos) break;
    nStart = nDot + 1;
  }
  return true;
}

bool Validator::isValidZoneId(const std::string& sZoneId) {
  if (sZoneId.size() != kZoneIdLen) return false;
  for (char c : sZoneId) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

bool Validator::isValidTtl(int iTtl) { return iTtl >= kMinTtl && iTtl <= kMaxTtl; }

std::optional<ValidationIssue> Validator::validateSubDomain(const SubDomain& sdCandidate,
                                                            const std::string& sPath) {
  if (sdCandidate.sName.size() > kMaxSubdomainNameLen) {
    return invalid(joinPath(sPath, "name"), "Subdomain name must be at most 63 characters");
  }
  if (!isValidSubdomainName(sdCandidate.sName)) {
    return invalid(joinPath(sPath, "name"),
                   "Subdomain name must be a valid domain name or '@' for the zone root");
  }
  if (!isValidTtl(sdCandidate.iTtl)) {
    return invalid(joinPath(sPath, "ttl"), "TTL must be between 60 and 86400 seconds");
  }
  return std::nullopt;
}

std::optional<ValidationIssue> Validator::validateZone(const Zone& znCandidate,
                                                       const std::string& sPath) {
  if (!isValidZoneId(znCandidate.sZoneId)) {
    return invalid(joinPath(sPath, "zone_id"),
                   "Zone ID must be a 32-character hexadecimal string");
  }

  for (size_t i = 0; i < znCandidate.vSubdomains.size(); ++i) {
    auto oIssue = validateSubDomain(
        znCandidate.vSubdomains[i],
        joinPath(joinPath(sPath, "subdomains"), std::to_string(i)));
    if (oIssue) return oIssue;
  }

  std::set<std::string> stNames;
  std::set<std::string> stIds;
  for (size_t i = 0; i < znCandidate.vSubdomains.size(); ++i) {
    const auto& sd = znCandidate.vSubdomains[i];
    const std::string sItemPath = joinPath(joinPath(sPath, "subdomains"), std::to_string(i));
    if (!stNames.insert(sd.sName).second) {
      return duplicate("duplicate_subdomain", sItemPath, "Duplicate subdomain name: " + sd.sName);
    }
    // Empty ids are assigned later and cannot collide yet
    if (!sd.sId.empty() && !stIds.insert(sd.sId).second) {
      return duplicate("duplicate_id", sItemPath, "Duplicate subdomain id: " + sd.sId);
    }
  }
  return std::nullopt;
}

std::optional<ValidationIssue> Validator::validateAccount(const CloudflareAccount& acctCandidate,
                                                          const std::string& sPath) {
  for (size_t i = 0; i < acctCandidate.vZones.size(); ++i) {
    auto oIssue = validateZone(acctCandidate.vZones[i],
                               joinPath(joinPath(sPath, "zones"), std::to_string(i)));
    if (oIssue) return oIssue;
  }

  std::set<std::string> stZoneIds;
  std::set<std::string> stIds;
  for (size_t i = 0; i < acctCandidate.vZones.size(); ++i) {
    const auto& zn = acctCandidate.vZones[i];
    const std::string sItemPath = joinPath(joinPath(sPath, "zones"), std::to_string(i));
    if (!stZoneIds.insert(zn.sZoneId).second) {
      return duplicate("duplicate_zone_id", sItemPath, "Duplicate zone ID: " + zn.sZoneId);
    }
    if (!zn.sId.empty() && !stIds.insert(zn.sId).second) {
      return duplicate("duplicate_id", sItemPath, "Duplicate zone id: " + zn.sId);
    }
  }
  return std::nullopt;
}

std::optional<ValidationIssue> Validator::validateConfig(const DdnsConfig& dcCandidate) {
  if (!isValidTtl(dcCandidate.iTtl)) {
    return invalid("ttl", "TTL must be between 60 and 86400 seconds");
  }
  for (size_t i = 0; i < dcCandidate.vCloudflare.size(); ++i) {
    auto oIssue = validateAccount(dcCandidate.vCloudflare[i],
                                  joinPath("cloudflare", std::to_string(i)));
    if (oIssue) return oIssue;
  }

  std::set<std::string> stIds;
  for (size_t i = 0; i < dcCandidate.vCloudflare.size(); ++i) {
    const auto& sId = dcCandidate.vCloudflare[i].sId;
    if (!sId.empty() && !stIds.insert(sId).second) {
      return duplicate("duplicate_id", joinPath("cloudflare", std::to_string(i)),
                       "Duplicate account id: " + sId);
    }
  }
  return std::nullopt;
}

}  // namespace ddns::model
