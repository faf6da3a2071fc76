#include "core/ConfigStore.hpp"

#include "common/Errors.hpp"
#include "common/IdGenerator.hpp"
#include "common/Logger.hpp"
#include "dal/ConfigRepository.hpp"
#include "model/Validator.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace ddns::core {

using model::Authentication;
using model::CloudflareAccount;
using model::DdnsConfig;
using model::ValidationIssue;
using model::Zone;

namespace {

void throwIfInvalid(const std::optional<ValidationIssue>& oIssue) {
  if (!oIssue) return;
  if (oIssue->kind == ValidationIssue::Kind::Duplicate) {
    throw common::ConflictError(oIssue->sCode, oIssue->describe());
  }
  throw common::ValidationError(oIssue->sCode, oIssue->describe());
}

void assignFreshIds(Zone& zn) {
  zn.sId = common::IdGenerator::generate();
  for (auto& sd : zn.vSubdomains) {
    sd.sId = common::IdGenerator::generate();
  }
}

void fillMissingIds(Zone& zn) {
  if (zn.sId.empty()) zn.sId = common::IdGenerator::generate();
  for (auto& sd : zn.vSubdomains) {
    if (sd.sId.empty()) sd.sId = common::IdGenerator::generate();
  }
}

bool hasValue(const std::optional<std::string>& oValue) {
  return oValue.has_value() && !oValue->empty();
}

/// Create-time collision check against one existing account.
void checkCredentialCollision(const Authentication& authCandidate,
                              const Authentication& authExisting) {
  if (hasValue(authCandidate.oApiToken) && authCandidate.oApiToken == authExisting.oApiToken) {
    throw common::ConflictError("duplicate_api_token", "API Token already exists");
  }
  if (!authCandidate.oApiKey || !authExisting.oApiKey) return;

  // Once both sides carry a key pair its fields are compared as-is, empty strings included
  const auto& akCandidate = *authCandidate.oApiKey;
  const auto& akExisting = *authExisting.oApiKey;
  if (akCandidate.sApiKey == akExisting.sApiKey) {
    throw common::ConflictError("duplicate_api_key", "API Key already exists");
  }
  if (akCandidate.sAccountEmail == akExisting.sAccountEmail) {
    throw common::ConflictError("duplicate_account_email", "Account email already exists");
  }
}

template <typename TConfig>
auto& findAccount(TConfig& dcConfig, const std::string& sAccountId) {
  auto it = std::find_if(dcConfig.vCloudflare.begin(), dcConfig.vCloudflare.end(),
                         [&](const CloudflareAccount& acct) { return acct.sId == sAccountId; });
  if (it == dcConfig.vCloudflare.end()) {
    throw common::NotFoundError("account_not_found", "Account " + sAccountId + " not found");
  }
  return *it;
}

template <typename TAccount>
auto& findZone(TAccount& acct, const std::string& sZoneId) {
  auto it = std::find_if(acct.vZones.begin(), acct.vZones.end(),
                         [&](const Zone& zn) { return zn.sId == sZoneId; });
  if (it == acct.vZones.end()) {
    throw common::NotFoundError("zone_not_found", "Zone " + sZoneId + " not found");
  }
  return *it;
}

}  // namespace

ConfigStore::ConfigStore(dal::ConfigRepository& crRepo) : _crRepo(crRepo) {}
ConfigStore::~ConfigStore() = default;

void ConfigStore::init() {
  auto dcLoaded = _crRepo.load();
  std::lock_guard<std::mutex> lock(_mtx);
  _dcConfig = std::move(dcLoaded);
}

DdnsConfig ConfigStore::snapshot() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _dcConfig;
}

void ConfigStore::commit(DdnsConfig dcNext) {
  try {
    _crRepo.save(dcNext);
  } catch (const common::AppError& e) {
    common::Logger::get()->error("Failed to persist config to {}: {}",
                                 _crRepo.path().string(), e.what());
    throw;
  }
  _dcConfig = std::move(dcNext);
}

// ── Accounts ───────────────────────────────────────────────────────────────

std::vector<CloudflareAccount> ConfigStore::listAccounts() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _dcConfig.vCloudflare;
}

CloudflareAccount ConfigStore::createAccount(CloudflareAccount acctCandidate) {
  acctCandidate.sId = common::IdGenerator::generate();
  for (auto& zn : acctCandidate.vZones) {
    assignFreshIds(zn);
  }
  throwIfInvalid(model::Validator::validateAccount(acctCandidate));

  std::lock_guard<std::mutex> lock(_mtx);
  for (const auto& acctExisting : _dcConfig.vCloudflare) {
    checkCredentialCollision(acctCandidate.authentication, acctExisting.authentication);
  }

  DdnsConfig dcNext = _dcConfig;
  dcNext.vCloudflare.push_back(acctCandidate);
  commit(std::move(dcNext));

  common::Logger::get()->info("Account {} created ({} zone(s))", acctCandidate.sId,
                              acctCandidate.vZones.size());
  return acctCandidate;
}

CloudflareAccount ConfigStore::getAccount(const std::string& sAccountId) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return findAccount(_dcConfig, sAccountId);
}

CloudflareAccount ConfigStore::updateAccount(const std::string& sAccountId,
                                             CloudflareAccount acctCandidate) {
  throwIfInvalid(model::Validator::validateAccount(acctCandidate));

  acctCandidate.sId = sAccountId;
  for (auto& zn : acctCandidate.vZones) {
    fillMissingIds(zn);
  }

  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  findAccount(dcNext, sAccountId) = acctCandidate;
  commit(std::move(dcNext));

  common::Logger::get()->info("Account {} updated", sAccountId);
  return acctCandidate;
}

void ConfigStore::deleteAccount(const std::string& sAccountId) {
  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  auto it = std::find_if(dcNext.vCloudflare.begin(), dcNext.vCloudflare.end(),
                         [&](const CloudflareAccount& acct) { return acct.sId == sAccountId; });
  if (it == dcNext.vCloudflare.end()) {
    throw common::NotFoundError("account_not_found", "Account " + sAccountId + " not found");
  }
  dcNext.vCloudflare.erase(it);
  commit(std::move(dcNext));

  common::Logger::get()->info("Account {} deleted", sAccountId);
}

Authentication ConfigStore::updateAuthentication(const std::string& sAccountId,
                                                 Authentication authCandidate) {
  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  findAccount(dcNext, sAccountId).authentication = authCandidate;
  commit(std::move(dcNext));

  common::Logger::get()->info("Authentication updated for account {}", sAccountId);
  return authCandidate;
}

// ── Zones ──────────────────────────────────────────────────────────────────

std::vector<Zone> ConfigStore::listZones(const std::string& sAccountId) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return findAccount(_dcConfig, sAccountId).vZones;
}

Zone ConfigStore::createZone(const std::string& sAccountId, Zone znCandidate) {
  assignFreshIds(znCandidate);
  throwIfInvalid(model::Validator::validateZone(znCandidate));

  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  auto& acct = findAccount(dcNext, sAccountId);

  const bool bExists = std::any_of(acct.vZones.begin(), acct.vZones.end(), [&](const Zone& zn) {
    return zn.sZoneId == znCandidate.sZoneId;
  });
  if (bExists) {
    throw common::ConflictError("duplicate_zone_id",
                                "Zone " + znCandidate.sZoneId + " already exists");
  }

  acct.vZones.push_back(znCandidate);
  commit(std::move(dcNext));

  common::Logger::get()->info("Zone {} ({}) created in account {} with {} subdomain(s)",
                              znCandidate.sId, znCandidate.sDomain, sAccountId,
                              znCandidate.vSubdomains.size());
  return znCandidate;
}

Zone ConfigStore::getZone(const std::string& sAccountId, const std::string& sZoneId) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return findZone(findAccount(_dcConfig, sAccountId), sZoneId);
}

Zone ConfigStore::updateZone(const std::string& sAccountId, const std::string& sZoneId,
                             Zone znCandidate) {
  throwIfInvalid(model::Validator::validateZone(znCandidate));

  znCandidate.sId = sZoneId;
  fillMissingIds(znCandidate);

  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  auto& zn = findZone(findAccount(dcNext, sAccountId), sZoneId);
  if (zn.sZoneId != znCandidate.sZoneId) {
    throw common::ValidationError("invalid_field",
                                  "Field 'zone_id': zone_id cannot be changed (was " +
                                      zn.sZoneId + ")");
  }
  zn = znCandidate;
  commit(std::move(dcNext));

  common::Logger::get()->info("Zone {} updated in account {}", sZoneId, sAccountId);
  return znCandidate;
}

void ConfigStore::deleteZone(const std::string& sAccountId, const std::string& sZoneId) {
  std::lock_guard<std::mutex> lock(_mtx);
  DdnsConfig dcNext = _dcConfig;
  auto& acct = findAccount(dcNext, sAccountId);
  auto it = std::find_if(acct.vZones.begin(), acct.vZones.end(),
                         [&](const Zone& zn) { return zn.sId == sZoneId; });
  if (it == acct.vZones.end()) {
    throw common::NotFoundError("zone_not_found", "Zone " + sZoneId + " not found");
  }
  acct.vZones.erase(it);
  commit(std::move(dcNext));

  common::Logger::get()->info("Zone {} deleted from account {}", sZoneId, sAccountId);
}

}  // namespace ddns::core
