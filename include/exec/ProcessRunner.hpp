#pragma once

#include <string>
#include <vector>

#include "exec/ICommandRunner.hpp"

namespace dnsc::exec {

/// fork/execvp based runner. Blocks until the child exits; no timeout.
/// Exit status is the child's exit code, 128 + signal number when killed,
/// or 127 when the program could not be executed.
/// Class abbreviation: pr
class ProcessRunner : public ICommandRunner {
 public:
  ProcessRunner();
  ~ProcessRunner() override;

  common::CommandResult capture(const std::vector<std::string>& vArgs) override;
  int passthrough(const std::vector<std::string>& vArgs) override;

 private:
  static int waitForChild(int iPid);
};

}  // namespace dnsc::exec
