#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dnsc::common {

/// Environment variable loader.
/// Loads all env vars into a typed struct with validation.
/// Every field has a default, so an empty environment is a valid configuration.
/// Class abbreviation: cfg
struct Config {
  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "warn";

  // ── External tools ────────────────────────────────────────────────────
  std::string sNmcliBin = "nmcli";
  std::string sResolvectlBin = "resolvectl";
  // Privilege-elevation prefix, split on whitespace ("sudo -n" -> {"sudo", "-n"}).
  // Empty = run mutating commands unelevated.
  std::vector<std::string> vElevateCmd{"sudo"};

  // ── Provider catalog ──────────────────────────────────────────────────
  std::optional<std::string> oProvidersFile;

  // ── Behaviour ─────────────────────────────────────────────────────────
  bool bValidateAddresses = false;
  int iExitCode = 0;

  /// Load and validate all config from environment variables.
  /// Throws std::runtime_error on invalid values.
  static Config load();

 private:
  /// Read an env var, return std::nullopt if unset.
  static std::optional<std::string> getEnvOpt(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Split on spaces and tabs, dropping empty words.
  static std::vector<std::string> splitWords(const std::string& sValue);

  /// Read an env var as bool (true/false/1/0/yes/no), with a default.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace dnsc::common
