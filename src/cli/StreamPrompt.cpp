#include "cli/StreamPrompt.hpp"

#include "common/Errors.hpp"

#include <stdexcept>
#include <string>

namespace dnsc::cli {

StreamPrompt::StreamPrompt(std::istream& isIn, std::ostream& osOut)
    : _isIn(isIn), _osOut(osOut) {}

StreamPrompt::~StreamPrompt() = default;

std::string StreamPrompt::readLine() {
  std::string sLine;
  if (!std::getline(_isIn, sLine)) {
    if (_isIn.eof()) {
      throw common::InputError("end_of_input", "End of input", true);
    }
    throw common::InputError("read_failed", "Failed to read from terminal");
  }
  if (!sLine.empty() && sLine.back() == '\r') {
    sLine.pop_back();
  }
  return sLine;
}

std::size_t StreamPrompt::select(const std::string& sTitle,
                                 const std::vector<std::string>& vItems,
                                 std::size_t nDefault) {
  if (vItems.empty()) {
    throw std::invalid_argument("select() needs at least one item");
  }
  if (nDefault >= vItems.size()) {
    nDefault = 0;
  }

  _osOut << "? " << sTitle << "\n";
  for (std::size_t i = 0; i < vItems.size(); ++i) {
    _osOut << (i == nDefault ? "> " : "  ") << (i + 1) << ") " << vItems[i] << "\n";
  }

  while (true) {
    _osOut << "Enter choice [" << (nDefault + 1) << "]: " << std::flush;
    const std::string sAnswer = readLine();
    if (sAnswer.empty()) {
      return nDefault;
    }

    std::size_t nPos = 0;
    unsigned long ulChoice = 0;
    try {
      ulChoice = std::stoul(sAnswer, &nPos);
    } catch (const std::logic_error&) {
      nPos = 0;
    }
    if (nPos == sAnswer.size() && ulChoice >= 1 && ulChoice <= vItems.size()) {
      return static_cast<std::size_t>(ulChoice - 1);
    }
    _osOut << "Please enter a number between 1 and " << vItems.size() << "\n";
  }
}

std::string StreamPrompt::input(const std::string& sTitle) {
  _osOut << "? " << sTitle << ": " << std::flush;
  return readLine();
}

}  // namespace dnsc::cli
