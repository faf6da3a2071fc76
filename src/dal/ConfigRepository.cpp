#include "dal/ConfigRepository.hpp"

#include "common/Errors.hpp"
#include "common/IdGenerator.hpp"
#include "common/Logger.hpp"
#include "model/JsonCodec.hpp"
#include "model/Validator.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace ddns::dal {

using model::JsonCodec;

namespace {

/// Insert a fresh "id" into every object of the array at jParent[pKey] that lacks one.
/// Returns the number of ids added.
int backfillIds(JsonCodec::Json& jParent, const char* pKey) {
  auto it = jParent.find(pKey);
  if (it == jParent.end() || !it->is_array()) return 0;

  int iAdded = 0;
  for (auto& jItem : *it) {
    if (jItem.is_object() && !jItem.contains("id")) {
      jItem["id"] = common::IdGenerator::generate();
      ++iAdded;
    }
  }
  return iAdded;
}

}  // namespace

ConfigRepository::ConfigRepository(std::filesystem::path pathFile)
    : _pathFile(std::move(pathFile)) {}

ConfigRepository::~ConfigRepository() = default;

model::DdnsConfig ConfigRepository::load() const {
  auto spLog = common::Logger::get();

  std::error_code ec;
  if (!std::filesystem::exists(_pathFile, ec)) {
    if (ec) {
      throw common::InternalError("load_failed",
                                  "Cannot stat config file " + _pathFile.string() + ": " +
                                      ec.message());
    }
    spLog->info("Config file {} not found, starting with defaults", _pathFile.string());
    return model::DdnsConfig{};
  }

  std::ifstream ifs(_pathFile);
  if (!ifs.is_open()) {
    throw common::InternalError("load_failed",
                                "Cannot open config file " + _pathFile.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();

  JsonCodec::Json jDoc;
  try {
    jDoc = JsonCodec::Json::parse(oss.str());
  } catch (const nlohmann::json::parse_error& e) {
    throw common::InternalError("load_failed", "Config file " + _pathFile.string() +
                                                   " is not valid JSON: " + e.what());
  }

  // Older files predate server-assigned ids; heal them instead of rejecting
  int iBackfilled = 0;
  if (jDoc.is_object()) {
    iBackfilled += backfillIds(jDoc, "cloudflare");
    if (auto itAccounts = jDoc.find("cloudflare");
        itAccounts != jDoc.end() && itAccounts->is_array()) {
      for (auto& jAccount : *itAccounts) {
        if (!jAccount.is_object()) continue;
        iBackfilled += backfillIds(jAccount, "zones");
        auto itZones = jAccount.find("zones");
        if (itZones == jAccount.end() || !itZones->is_array()) continue;
        for (auto& jZone : *itZones) {
          if (jZone.is_object()) {
            iBackfilled += backfillIds(jZone, "subdomains");
          }
        }
      }
    }
  }

  model::DdnsConfig dc;
  try {
    dc = JsonCodec::decodeConfig(jDoc);
  } catch (const common::ValidationError& e) {
    throw common::InternalError("load_failed",
                                "Invalid config file " + _pathFile.string() + ": " + e.what());
  }

  if (auto oIssue = model::Validator::validateConfig(dc)) {
    throw common::InternalError("load_failed", "Invalid config file " + _pathFile.string() +
                                                   ": " + oIssue->describe());
  }

  if (iBackfilled > 0) {
    spLog->info("Assigned {} missing id(s) while loading {}", iBackfilled, _pathFile.string());
  }
  spLog->info("Loaded config from {} ({} account(s))", _pathFile.string(), dc.vCloudflare.size());
  return dc;
}

void ConfigRepository::save(const model::DdnsConfig& dcConfig) const {
  const std::string sBody = JsonCodec::toJson(dcConfig).dump(2) + "\n";

  auto pathTemp = _pathFile;
  pathTemp += ".tmp";

  auto discardTemp = [&pathTemp](const std::string& sReason) {
    std::error_code ecRemove;
    std::filesystem::remove(pathTemp, ecRemove);
    throw common::InternalError("persist_failed", sReason);
  };

  const int iFd = ::open(pathTemp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (iFd < 0) {
    throw common::InternalError("persist_failed", "Cannot open " + pathTemp.string() +
                                                      " for writing: " + std::strerror(errno));
  }

  size_t nWritten = 0;
  while (nWritten < sBody.size()) {
    const ssize_t iRet = ::write(iFd, sBody.data() + nWritten, sBody.size() - nWritten);
    if (iRet < 0) {
      if (errno == EINTR) continue;
      const std::string sError = std::strerror(errno);
      ::close(iFd);
      discardTemp("Failed to write " + pathTemp.string() + ": " + sError);
    }
    nWritten += static_cast<size_t>(iRet);
  }

  // Contents must be on disk before the rename makes them visible
  if (::fsync(iFd) != 0) {
    const std::string sError = std::strerror(errno);
    ::close(iFd);
    discardTemp("Failed to sync " + pathTemp.string() + ": " + sError);
  }
  if (::close(iFd) != 0) {
    discardTemp("Failed to close " + pathTemp.string() + ": " + std::strerror(errno));
  }

  std::error_code ec;
  std::filesystem::rename(pathTemp, _pathFile, ec);
  if (ec) {
    discardTemp("Failed to replace " + _pathFile.string() + ": " + ec.message());
  }

  // Persist the directory entry as well; the new contents are already durable
  auto pathDir = _pathFile.parent_path();
  if (pathDir.empty()) pathDir = ".";
  const int iDirFd = ::open(pathDir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (iDirFd >= 0) {
    if (::fsync(iDirFd) != 0) {
      common::Logger::get()->warn("Failed to sync directory {}: {}", pathDir.string(),
                                  std::strerror(errno));
    }
    ::close(iDirFd);
  }
}

}  // namespace ddns::dal
