#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "exec/ICommandRunner.hpp"

namespace dnsc::nm {

/// Drives NetworkManager through nmcli.
/// Mutating calls (modify, down, up) run behind the configured elevation command;
/// queries run as the invoking user.
/// Class abbreviation: nm
class NetworkManager {
 public:
  NetworkManager(exec::ICommandRunner& crRunner, const common::Config& cfg);
  ~NetworkManager();

  /// Name of the first active connection bound to a device.
  /// Throws DiscoveryError when nmcli fails or nothing is bound.
  std::string findActiveConnection();

  /// Set a static IPv4 DNS pair and ignore DHCP-provided servers, then restart.
  /// Throws ValidationError (only when address validation is enabled) or CommandError.
  void applyDns(const std::string& sConnection, const std::string& sPrimary,
                const std::string& sSecondary);

  /// Clear the IPv4 DNS override and accept DHCP-provided servers, then restart.
  void setAutomaticDns(const std::string& sConnection);

  /// Connection down (failure ignored), then up (failure throws CommandError).
  void restartConnection(const std::string& sConnection);

  /// DNS-related lines of "nmcli connection show <name>".
  /// Empty when the query fails.
  std::vector<std::string> showDnsSettings(const std::string& sConnection);

  /// Stream "resolvectl status" to the terminal. Exit status is ignored.
  void printResolverStatus();

  /// Run an elevated "nmcli <args>". Throws CommandError on non-zero exit.
  void execute(const std::vector<std::string>& vArgs);

  /// First NAME of a "NAME:DEVICE" line with a non-empty DEVICE.
  static std::optional<std::string> parseActiveConnection(const std::string& sOutput);

  /// Lines containing "ipv4.dns" or "ipv4.ignore-auto-dns".
  static std::vector<std::string> filterDnsLines(const std::string& sDump);

  /// "<primary> <secondary>"
  static std::string joinDnsValue(const std::string& sPrimary, const std::string& sSecondary);

  /// True for a literal IPv4 or IPv6 address.
  static bool isIpAddress(const std::string& sAddress);

 private:
  std::vector<std::string> elevated(const std::vector<std::string>& vNmcliArgs) const;
  std::vector<std::string> plain(const std::vector<std::string>& vNmcliArgs) const;

  exec::ICommandRunner& _crRunner;
  std::string _sNmcliBin;
  std::string _sResolvectlBin;
  std::vector<std::string> _vElevateCmd;
  bool _bValidateAddresses;
};

}  // namespace dnsc::nm
