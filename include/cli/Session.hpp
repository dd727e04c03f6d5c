#pragma once

#include <ostream>
#include <string>

#include "cli/IPrompt.hpp"
#include "common/Types.hpp"
#include "core/ProviderCatalog.hpp"
#include "nm/NetworkManager.hpp"

namespace dnsc::cli {

/// Interactive menu bound to one connection for the lifetime of the process.
/// The connection name is discovered once by the caller and never re-validated.
/// Class abbreviation: ss
class Session {
 public:
  Session(const core::ProviderCatalog& pcCatalog, std::string sConnection,
          nm::NetworkManager& nmManager, IPrompt& ipPrompt, std::ostream& osOut,
          std::ostream& osErr, int iExitCode);
  ~Session();

  /// Loop until the user picks Exit or input ends. Action errors are printed
  /// as "Error: <message>" and the menu is shown again.
  /// Returns the process exit status.
  int run();

  /// Show the menu once and perform the chosen action.
  /// Errors from the action propagate to the caller.
  common::MenuAction runOnce();

  const std::string& connection() const { return _sConnection; }

 private:
  void selectProvider();
  void setCustomDns();
  void setAutomaticDns();
  void showCurrentDns();

  const core::ProviderCatalog& _pcCatalog;
  const std::string _sConnection;
  nm::NetworkManager& _nmManager;
  IPrompt& _ipPrompt;
  std::ostream& _osOut;
  std::ostream& _osErr;
  int _iExitCode;
};

}  // namespace dnsc::cli
