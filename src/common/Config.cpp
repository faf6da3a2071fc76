#include "common/Config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ddns::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nConsumed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nConsumed);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (nConsumed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

Config Config::load() {
  Config cfg;

  const std::string sConfigFile = getEnv("DDNS_CONFIG_FILE");
  if (!sConfigFile.empty()) {
    cfg.sConfigFile = sConfigFile;
  }

  const std::string sHost = getEnv("DDNS_HTTP_HOST");
  if (!sHost.empty()) {
    cfg.sHttpHost = sHost;
  }
  cfg.iHttpPort = getEnvInt("DDNS_HTTP_PORT", 8000);
  cfg.iHttpThreads = getEnvInt("DDNS_HTTP_THREADS", 4);

  const std::string sLogLevel = getEnv("DDNS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error(
        "DDNS_HTTP_PORT must be between 1 and 65535 (got " +
        std::to_string(cfg.iHttpPort) + ")");
  }

  if (cfg.iHttpThreads < 1) {
    throw std::runtime_error(
        "DDNS_HTTP_THREADS must be >= 1 (got " + std::to_string(cfg.iHttpThreads) + ")");
  }

  return cfg;
}

}  // namespace ddns::common
