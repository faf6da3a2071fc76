#pragma once

#include <string>

namespace ddns::common {

/// Server-side identifier generation for accounts, zones and subdomains.
/// Class abbreviation: N/A (static interface)
class IdGenerator {
 public:
  /// Random RFC 4122 version-4 UUID, lowercase 8-4-4-4-12 form (36 chars).
  /// Throws InternalError if the CSPRNG fails.
  static std::string generate();
};

}  // namespace ddns::common
