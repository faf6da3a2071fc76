#pragma once

#include <filesystem>

#include "model/Entities.hpp"

namespace ddns::dal {

/// Loads and saves the managed configuration document as a JSON file.
/// Not thread-safe; callers serialize access (see core::ConfigStore).
/// Class abbreviation: cr
class ConfigRepository {
 public:
  explicit ConfigRepository(std::filesystem::path pathFile);
  ~ConfigRepository();

  /// Read the document. A missing file yields an empty DdnsConfig with defaults.
  /// Missing "id" keys on accounts, zones and subdomains are filled with
  /// fresh ids before validation.
  /// Throws InternalError("load_failed") on I/O, syntax or schema errors.
  model::DdnsConfig load() const;

  /// Overwrite the document via <file>.tmp, fsync, then rename.
  /// Throws InternalError("persist_failed"); the previous file is left intact.
  void save(const model::DdnsConfig& dcConfig) const;

  const std::filesystem::path& path() const { return _pathFile; }

 private:
  std::filesystem::path _pathFile;
};

}  // namespace ddns::dal
