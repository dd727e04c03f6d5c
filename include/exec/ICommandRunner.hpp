#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnsc::exec {

/// Pure abstract interface for running external programs.
/// vArgs[0] is the program, looked up on PATH.
class ICommandRunner {
 public:
  virtual ~ICommandRunner() = default;

  /// Run to completion, capturing stdout and stderr.
  virtual common::CommandResult capture(const std::vector<std::string>& vArgs) = 0;

  /// Run to completion with the child attached to this process' terminal.
  /// Returns the exit status.
  virtual int passthrough(const std::vector<std::string>& vArgs) = 0;
};

}  // namespace dnsc::exec
