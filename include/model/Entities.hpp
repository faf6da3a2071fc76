#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ddns::model {

constexpr int kMinTtl = 60;
constexpr int kMaxTtl = 86400;
constexpr int kDefaultTtl = 300;
constexpr size_t kMaxSubdomainNameLen = 63;
constexpr size_t kZoneIdLen = 32;

/// A DNS record name kept in sync by the update agent.
/// Class abbreviation: sd
struct SubDomain {
  std::string sId;
  std::string sName;
  bool bProxied = false;
  int iTtl = kDefaultTtl;

  bool operator==(const SubDomain&) const = default;
};

/// A Cloudflare zone and the subdomains managed inside it.
/// Class abbreviation: zn
struct Zone {
  std::string sId;
  std::string sZoneId;  // Cloudflare-assigned, 32 lowercase hex chars
  std::string sDomain;
  std::vector<SubDomain> vSubdomains;

  bool operator==(const Zone&) const = default;
};

/// Global API key credential; both fields are required together.
/// Class abbreviation: ak
struct ApiKey {
  std::string sApiKey;
  std::string sAccountEmail;

  bool operator==(const ApiKey&) const = default;
};

/// Credentials for one Cloudflare account. Either form, or both, may be set.
/// Class abbreviation: auth
struct Authentication {
  std::optional<std::string> oApiToken;
  std::optional<ApiKey> oApiKey;

  bool operator==(const Authentication&) const = default;
};

/// Class abbreviation: acct
struct CloudflareAccount {
  std::string sId;
  Authentication authentication;
  std::vector<Zone> vZones;

  bool operator==(const CloudflareAccount&) const = default;
};

/// Root of the managed configuration document.
/// Class abbreviation: dc
struct DdnsConfig {
  std::vector<CloudflareAccount> vCloudflare;
  bool bA = true;
  bool bAaaa = true;
  bool bPurgeUnknownRecords = false;
  int iTtl = kDefaultTtl;

  bool operator==(const DdnsConfig&) const = default;
};

}  // namespace ddns::model
