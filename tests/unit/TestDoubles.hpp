#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/IPrompt.hpp"
#include "common/Types.hpp"
#include "exec/ICommandRunner.hpp"

namespace dnsc::test {

/// Records every command and answers through a handler (default: exit 0, no output).
class FakeCommandRunner : public exec::ICommandRunner {
 public:
  using Handler = std::function<common::CommandResult(const std::vector<std::string>&)>;

  common::CommandResult capture(const std::vector<std::string>& vArgs) override {
    vCaptured.push_back(vArgs);
    if (fnHandler) {
      return fnHandler(vArgs);
    }
    return common::CommandResult{0, "", ""};
  }

  int passthrough(const std::vector<std::string>& vArgs) override {
    vPassthrough.push_back(vArgs);
    return iPassthroughStatus;
  }

  Handler fnHandler;
  int iPassthroughStatus = 0;
  std::vector<std::vector<std::string>> vCaptured;
  std::vector<std::vector<std::string>> vPassthrough;
};

/// Plays back queued answers. Throws std::logic_error when the script runs dry.
class ScriptedPrompt : public cli::IPrompt {
 public:
  std::size_t select(const std::string& sTitle, const std::vector<std::string>& vItems,
                     std::size_t /*nDefault*/) override {
    vSelectTitles.push_back(sTitle);
    vLastItems = vItems;
    if (dqSelections.empty()) {
      throw std::logic_error("unexpected select: " + sTitle);
    }
    auto nChoice = dqSelections.front();
    dqSelections.pop_front();
    return nChoice;
  }

  std::string input(const std::string& sTitle) override {
    vInputTitles.push_back(sTitle);
    if (dqInputs.empty()) {
      throw std::logic_error("unexpected input: " + sTitle);
    }
    auto sAnswer = dqInputs.front();
    dqInputs.pop_front();
    return sAnswer;
  }

  std::deque<std::size_t> dqSelections;
  std::deque<std::string> dqInputs;
  std::vector<std::string> vSelectTitles;
  std::vector<std::string> vInputTitles;
  std::vector<std::string> vLastItems;
};

}  // namespace dnsc::test
