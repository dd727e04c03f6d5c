#include "common/Config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace dnsc::common {

std::optional<std::string> Config::getEnvOpt(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  if (pValue == nullptr) {
    return std::nullopt;
  }
  return std::string(pValue);
}

std::string Config::getEnv(const char* pVarName) {
  return getEnvOpt(pVarName).value_or(std::string{});
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::vector<std::string> Config::splitWords(const std::string& sValue) {
  std::vector<std::string> vWords;
  std::string sWord;
  for (char c : sValue) {
    if (c == ' ' || c == '\t') {
      if (!sWord.empty()) {
        vWords.push_back(std::move(sWord));
        sWord.clear();
      }
    } else {
      sWord += c;
    }
  }
  if (!sWord.empty()) {
    vWords.push_back(std::move(sWord));
  }
  return vWords;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") {
    return true;
  }
  if (sValue == "false" || sValue == "0" || sValue == "no") {
    return false;
  }
  throw std::runtime_error(
      std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

Config Config::load() {
  Config cfg;

  // Logging
  const std::string sLogLevel = getEnv("DNSC_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    // spdlog maps unknown names to "off"; only accept "off" when asked for it
    if (spdlog::level::from_str(sLogLevel) == spdlog::level::off && sLogLevel != "off") {
      throw std::runtime_error("Invalid log level for DNSC_LOG_LEVEL: " + sLogLevel);
    }
    cfg.sLogLevel = sLogLevel;
  }

  // ── External tools ─────────────────────────────────────────────────────
  if (auto oNmcli = getEnvOpt("DNSC_NMCLI_BIN")) {
    if (oNmcli->empty()) {
      throw std::runtime_error("DNSC_NMCLI_BIN must not be empty");
    }
    cfg.sNmcliBin = *oNmcli;
  }
  if (auto oResolvectl = getEnvOpt("DNSC_RESOLVECTL_BIN")) {
    if (oResolvectl->empty()) {
      throw std::runtime_error("DNSC_RESOLVECTL_BIN must not be empty");
    }
    cfg.sResolvectlBin = *oResolvectl;
  }
  // Set-but-blank is meaningful here: it disables elevation
  if (auto oElevate = getEnvOpt("DNSC_ELEVATE_CMD")) {
    cfg.vElevateCmd = splitWords(*oElevate);
  }

  // Provider catalog
  const std::string sProvidersFile = getEnv("DNSC_PROVIDERS_FILE");
  if (!sProvidersFile.empty()) {
    cfg.oProvidersFile = sProvidersFile;
  }

  // ── Behaviour ──────────────────────────────────────────────────────────
  cfg.bValidateAddresses = getEnvBool("DNSC_VALIDATE_ADDRESSES", false);
  cfg.iExitCode = getEnvInt("DNSC_EXIT_CODE", 0);

  // ── Validation ─────────────────────────────────────────────────────────
  if (cfg.iExitCode < 0 || cfg.iExitCode > 255) {
    throw std::runtime_error(
        "DNSC_EXIT_CODE must be within 0..255 (got " + std::to_string(cfg.iExitCode) + ")");
  }

  return cfg;
}

}  // namespace dnsc::common
