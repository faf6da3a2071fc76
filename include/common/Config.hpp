#pragma once

#include <string>

namespace ddns::common {

/// Process settings loaded from environment variables at startup.
/// This is the service's own runtime configuration, not the managed
/// account/zone document (see model::DdnsConfig).
/// Class abbreviation: cfg
struct Config {
  // ── Storage ───────────────────────────────────────────────────────────
  std::string sConfigFile = "config.json";

  // ── HTTP ──────────────────────────────────────────────────────────────
  std::string sHttpHost = "0.0.0.0";
  int iHttpPort = 8000;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all settings from environment variables.
  /// Throws std::runtime_error on invalid values.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace ddns::common
