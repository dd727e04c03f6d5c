#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace dnsc::cli {

/// Pure abstract interface for interactive input.
class IPrompt {
 public:
  virtual ~IPrompt() = default;

  /// Let the user pick one of vItems. Returns its index.
  virtual std::size_t select(const std::string& sTitle, const std::vector<std::string>& vItems,
                             std::size_t nDefault) = 0;

  /// Read one free-text line. Returned as typed, without validation.
  virtual std::string input(const std::string& sTitle) = 0;
};

}  // namespace dnsc::cli
