#include "nm/NetworkManager.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstdint>
#include <sstream>
#include <utility>

namespace dnsc::nm {

namespace {

std::vector<std::string> splitLines(const std::string& sText) {
  std::vector<std::string> vLines;
  std::istringstream iss(sText);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    if (!sLine.empty() && sLine.back() == '\r') {
      sLine.pop_back();
    }
    vLines.push_back(std::move(sLine));
  }
  return vLines;
}

/// Structural UTF-8 check (lead/continuation bytes, no overlongs or surrogates).
bool isValidUtf8(const std::string& sText) {
  const auto* p = reinterpret_cast<const unsigned char*>(sText.data());
  const auto* pEnd = p + sText.size();
  while (p < pEnd) {
    unsigned char c = *p;
    int iExtra = 0;
    uint32_t uCode = 0;
    if (c < 0x80) {
      ++p;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      iExtra = 1;
      uCode = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      iExtra = 2;
      uCode = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      iExtra = 3;
      uCode = c & 0x07;
    } else {
      return false;
    }
    if (pEnd - p <= iExtra) {
      return false;
    }
    for (int i = 1; i <= iExtra; ++i) {
      if ((p[i] & 0xC0) != 0x80) return false;
      uCode = (uCode << 6) | (p[i] & 0x3F);
    }
    if ((iExtra == 1 && uCode < 0x80) || (iExtra == 2 && uCode < 0x800) ||
        (iExtra == 3 && uCode < 0x10000) || uCode > 0x10FFFF ||
        (uCode >= 0xD800 && uCode <= 0xDFFF)) {
      return false;
    }
    p += iExtra + 1;
  }
  return true;
}

}  // namespace

NetworkManager::NetworkManager(exec::ICommandRunner& crRunner, const common::Config& cfg)
    : _crRunner(crRunner),
      _sNmcliBin(cfg.sNmcliBin),
      _sResolvectlBin(cfg.sResolvectlBin),
      _vElevateCmd(cfg.vElevateCmd),
      _bValidateAddresses(cfg.bValidateAddresses) {}

NetworkManager::~NetworkManager() = default;

std::vector<std::string> NetworkManager::plain(const std::vector<std::string>& vNmcliArgs) const {
  std::vector<std::string> vArgs{_sNmcliBin};
  vArgs.insert(vArgs.end(), vNmcliArgs.begin(), vNmcliArgs.end());
  return vArgs;
}

std::vector<std::string> NetworkManager::elevated(
    const std::vector<std::string>& vNmcliArgs) const {
  auto vArgs = plain(vNmcliArgs);
  vArgs.insert(vArgs.begin(), _vElevateCmd.begin(), _vElevateCmd.end());
  return vArgs;
}

std::optional<std::string> NetworkManager::parseActiveConnection(const std::string& sOutput) {
  for (const auto& sLine : splitLines(sOutput)) {
    auto nColon = sLine.find(':');
    if (nColon == std::string::npos) {
      continue;
    }
    // Second field ends at the next separator, if any
    auto nNext = sLine.find(':', nColon + 1);
    auto sDevice = sLine.substr(nColon + 1, nNext == std::string::npos
                                                ? std::string::npos
                                                : nNext - nColon - 1);
    if (!sDevice.empty()) {
      return sLine.substr(0, nColon);
    }
  }
  return std::nullopt;
}

std::string NetworkManager::findActiveConnection() {
  auto spLog = common::Logger::get();

  common::CommandResult crResult;
  try {
    crResult = _crRunner.capture(
        plain({"-t", "-f", "NAME,DEVICE", "connection", "show", "--active"}));
  } catch (const common::CommandError& ex) {
    throw common::DiscoveryError("list_failed",
                                 std::string("Failed to get active connections: ") + ex.what());
  }

  if (!crResult.succeeded()) {
    spLog->error("Listing active connections failed (status {}): {}", crResult.iExitCode,
                 crResult.sStderr);
    throw common::DiscoveryError("list_failed", "Failed to get active connections");
  }
  if (!isValidUtf8(crResult.sStdout)) {
    throw common::DiscoveryError("invalid_output",
                                 "Active connection listing is not valid UTF-8");
  }

  auto oName = parseActiveConnection(crResult.sStdout);
  if (!oName) {
    throw common::DiscoveryError("no_active_connection", "No active connection found");
  }
  spLog->info("Active connection: {}", *oName);
  return *oName;
}

void NetworkManager::execute(const std::vector<std::string>& vArgs) {
  auto crResult = _crRunner.capture(elevated(vArgs));
  if (!crResult.succeeded()) {
    throw common::CommandError("command_failed", "Command failed: " + crResult.sStderr,
                               crResult.iExitCode, crResult.sStderr);
  }
}

std::string NetworkManager::joinDnsValue(const std::string& sPrimary,
                                         const std::string& sSecondary) {
  return sPrimary + " " + sSecondary;
}

bool NetworkManager::isIpAddress(const std::string& sAddress) {
  in_addr addr4{};
  in6_addr addr6{};
  return inet_pton(AF_INET, sAddress.c_str(), &addr4) == 1 ||
         inet_pton(AF_INET6, sAddress.c_str(), &addr6) == 1;
}

void NetworkManager::applyDns(const std::string& sConnection, const std::string& sPrimary,
                              const std::string& sSecondary) {
  if (_bValidateAddresses) {
    for (const auto* pAddr : {&sPrimary, &sSecondary}) {
      if (!isIpAddress(*pAddr)) {
        throw common::ValidationError("invalid_address",
                                      "Not an IP address: '" + *pAddr + "'");
      }
    }
  }

  const std::string sDns = joinDnsValue(sPrimary, sSecondary);
  common::Logger::get()->info("Setting DNS on '{}' to '{}'", sConnection, sDns);

  execute({"connection", "mod", sConnection, "ipv4.dns", sDns, "ipv4.ignore-auto-dns", "yes"});
  restartConnection(sConnection);
}

void NetworkManager::setAutomaticDns(const std::string& sConnection) {
  common::Logger::get()->info("Reverting '{}' to automatic DNS", sConnection);

  execute({"connection", "mod", sConnection, "ipv4.dns", "", "ipv4.ignore-auto-dns", "no",
           "ipv6.ignore-auto-dns", "no"});
  restartConnection(sConnection);
}

void NetworkManager::restartConnection(const std::string& sConnection) {
  auto spLog = common::Logger::get();

  // Down is best-effort: the connection may already be down
  try {
    auto crDown = _crRunner.capture(elevated({"connection", "down", sConnection}));
    if (!crDown.succeeded()) {
      spLog->debug("Ignoring failed 'connection down {}' (status {}): {}", sConnection,
                  crDown.iExitCode, crDown.sStderr);
    }
  } catch (const common::CommandError& ex) {
    spLog->debug("Ignoring failed 'connection down {}': {}", sConnection, ex.what());
  }

  auto crUp = _crRunner.capture(elevated({"connection", "up", sConnection}));
  if (!crUp.succeeded()) {
    throw common::CommandError("restart_failed",
                               "Failed to restart connection: " + crUp.sStderr,
                               crUp.iExitCode, crUp.sStderr);
  }
  spLog->info("Connection '{}' restarted", sConnection);
}

std::vector<std::string> NetworkManager::filterDnsLines(const std::string& sDump) {
  std::vector<std::string> vMatches;
  for (auto& sLine : splitLines(sDump)) {
    if (sLine.find("ipv4.dns") != std::string::npos ||
        sLine.find("ipv4.ignore-auto-dns") != std::string::npos) {
      vMatches.push_back(std::move(sLine));
    }
  }
  return vMatches;
}

std::vector<std::string> NetworkManager::showDnsSettings(const std::string& sConnection) {
  auto crResult = _crRunner.capture(plain({"connection", "show", sConnection}));
  if (!crResult.succeeded()) {
    common::Logger::get()->debug("'connection show {}' failed (status {}): {}", sConnection,
                                crResult.iExitCode, crResult.sStderr);
    return {};
  }
  return filterDnsLines(crResult.sStdout);
}

void NetworkManager::printResolverStatus() {
  try {
    int iStatus = _crRunner.passthrough({_sResolvectlBin, "status"});
    if (iStatus != 0) {
      common::Logger::get()->info("{} status exited with {}", _sResolvectlBin, iStatus);
    }
  } catch (const common::CommandError& ex) {
    common::Logger::get()->debug("Could not run {}: {}", _sResolvectlBin, ex.what());
  }
}

}  // namespace dnsc::nm
