#pragma once

#include <istream>
#include <ostream>

#include "cli/IPrompt.hpp"

namespace dnsc::cli {

/// Numbered-list prompt over a pair of streams (normally std::cin / std::cout).
/// An empty answer picks the default; invalid answers are asked again.
/// Throws InputError when the input stream ends or fails.
/// Class abbreviation: sp
class StreamPrompt : public IPrompt {
 public:
  StreamPrompt(std::istream& isIn, std::ostream& osOut);
  ~StreamPrompt() override;

  std::size_t select(const std::string& sTitle, const std::vector<std::string>& vItems,
                     std::size_t nDefault) override;
  std::string input(const std::string& sTitle) override;

 private:
  std::string readLine();

  std::istream& _isIn;
  std::ostream& _osOut;
};

}  // namespace dnsc::cli
