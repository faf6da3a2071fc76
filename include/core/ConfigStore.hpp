#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "model/Entities.hpp"

namespace ddns::dal {
class ConfigRepository;
}

namespace ddns::core {

/// Owns the in-memory configuration tree and serializes every access to it.
/// Writers mutate a working copy, persist it and only then swap it in while
/// holding the lock, so a failed save leaves memory matching disk.
///
/// Errors: ValidationError (422), ConflictError (400), NotFoundError (404),
/// InternalError (500, persistence). All are raised before the tree changes.
/// Class abbreviation: cs
class ConfigStore {
 public:
  explicit ConfigStore(dal::ConfigRepository& crRepo);
  ~ConfigStore();

  ConfigStore(const ConfigStore&) = delete;
  ConfigStore& operator=(const ConfigStore&) = delete;

  /// Load the tree from the repository. Call once before serving requests.
  void init();

  /// Copy of the whole tree.
  model::DdnsConfig snapshot() const;

  // ── Accounts ──────────────────────────────────────────────────────────

  std::vector<model::CloudflareAccount> listAccounts() const;

  /// Assigns fresh ids to the account and everything nested in it.
  /// Rejects credentials already used by another account, checked per
  /// existing account in the order token, key, email.
  model::CloudflareAccount createAccount(model::CloudflareAccount acctCandidate);

  model::CloudflareAccount getAccount(const std::string& sAccountId) const;

  /// Full replacement; the account id is pinned to sAccountId. Credential
  /// uniqueness is not re-checked here, only on create.
  model::CloudflareAccount updateAccount(const std::string& sAccountId,
                                         model::CloudflareAccount acctCandidate);

  void deleteAccount(const std::string& sAccountId);

  model::Authentication updateAuthentication(const std::string& sAccountId,
                                             model::Authentication authCandidate);

  // ── Zones ─────────────────────────────────────────────────────────────

  std::vector<model::Zone> listZones(const std::string& sAccountId) const;

  /// Assigns fresh ids to the zone and its subdomains.
  model::Zone createZone(const std::string& sAccountId, model::Zone znCandidate);

  model::Zone getZone(const std::string& sAccountId, const std::string& sZoneId) const;

  /// Full replacement; the id is pinned to sZoneId and zone_id may not change.
  model::Zone updateZone(const std::string& sAccountId, const std::string& sZoneId,
                         model::Zone znCandidate);

  void deleteZone(const std::string& sAccountId, const std::string& sZoneId);

 private:
  /// Persist dcNext and make it current. Caller holds _mtx.
  void commit(model::DdnsConfig dcNext);

  dal::ConfigRepository& _crRepo;
  model::DdnsConfig _dcConfig;
  mutable std::mutex _mtx;
};

}  // namespace ddns::core
