#pragma once

#include <optional>
#include <string>

#include "model/Entities.hpp"

namespace ddns::model {

/// First constraint violation found in a candidate entity.
/// Class abbreviation: vi
struct ValidationIssue {
  enum class Kind { Invalid, Duplicate };

  Kind kind = Kind::Invalid;
  std::string sCode;   // error code slug, e.g. "invalid_field", "duplicate_subdomain"
  std::string sField;  // " -> "-joined path inside the candidate, empty for the root
  std::string sMessage;

  /// "Field '<path>': <message>" for invalid fields, the bare message otherwise.
  std::string describe() const;
};

/// Structural and cross-field checks for the entity tree.
/// Each check runs structural validation on every member first, then
/// sibling uniqueness, and reports the first issue found.
/// Class abbreviation: N/A (static interface)
class Validator {
 public:
  /// "@" or dot-separated labels of [A-Za-z0-9-] with no leading/trailing
  /// hyphen, at most 63 characters in total.
  static bool isValidSubdomainName(const std::string& sName);

  /// Exactly 32 characters of [0-9a-f].
  static bool isValidZoneId(const std::string& sZoneId);

  static bool isValidTtl(int iTtl);

  static std::optional<ValidationIssue> validateSubDomain(const SubDomain& sdCandidate,
                                                          const std::string& sPath = "");

  /// Subdomain names, and subdomain ids where set, must be unique within the zone.
  static std::optional<ValidationIssue> validateZone(const Zone& znCandidate,
                                                     const std::string& sPath = "");

  /// zone_id values, and zone ids where set, must be unique within the account.
  static std::optional<ValidationIssue> validateAccount(const CloudflareAccount& acctCandidate,
                                                        const std::string& sPath = "");

  /// Account ids, where set, must be unique.
  static std::optional<ValidationIssue> validateConfig(const DdnsConfig& dcCandidate);

 private:
  static std::string joinPath(const std::string& sPrefix, const std::string& sSegment);
};

}  // namespace ddns::model
