#pragma once

#include <string>

namespace dnsc::common {

/// Named pair of resolver addresses.
/// Class abbreviation: dp
struct DnsProvider {
  std::string sName;
  std::string sPrimaryDns;
  std::string sSecondaryDns;
  std::string sDescription;
};

/// Outcome of an external process run with captured output.
/// Class abbreviation: cr
struct CommandResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;

  bool succeeded() const { return iExitCode == 0; }
};

/// What the menu loop should do after an iteration.
enum class MenuAction { Continue, Exit };

}  // namespace dnsc::common
