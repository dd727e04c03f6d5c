#include "cli/StreamPrompt.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using dnsc::cli::StreamPrompt;
using dnsc::common::InputError;

namespace {

const std::vector<std::string> kItems{"Alpha", "Beta", "Gamma"};

}  // namespace

TEST(StreamPromptTest, SelectReturnsZeroBasedIndex) {
  std::istringstream iss("2\n");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  EXPECT_EQ(sp.select("Pick", kItems, 0), 1u);
  EXPECT_NE(oss.str().find("? Pick"), std::string::npos);
  EXPECT_NE(oss.str().find("3) Gamma"), std::string::npos);
}

TEST(StreamPromptTest, EmptyAnswerSelectsDefault) {
  std::istringstream iss("\n");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  EXPECT_EQ(sp.select("Pick", kItems, 2), 2u);
}

TEST(StreamPromptTest, InvalidAnswersAreAskedAgain) {
  std::istringstream iss("0\nfour\n2x\n9\n3\n");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  EXPECT_EQ(sp.select("Pick", kItems, 0), 2u);
  EXPECT_NE(oss.str().find("Please enter a number between 1 and 3"), std::string::npos);
}

TEST(StreamPromptTest, SelectAtEndOfInputThrows) {
  std::istringstream iss("");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  try {
    sp.select("Pick", kItems, 0);
    FAIL() << "expected InputError";
  } catch (const InputError& ex) {
    EXPECT_TRUE(ex._bEndOfInput);
  }
}

TEST(StreamPromptTest, InputReturnsLineVerbatim) {
  std::istringstream iss("  not an ip \r\n\n");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  EXPECT_EQ(sp.input("Enter primary DNS"), "  not an ip ");
  EXPECT_EQ(sp.input("Enter secondary DNS"), "");
  EXPECT_NE(oss.str().find("? Enter primary DNS: "), std::string::npos);
}

TEST(StreamPromptTest, InputAtEndOfInputThrows) {
  std::istringstream iss("");
  std::ostringstream oss;
  StreamPrompt sp(iss, oss);
  EXPECT_THROW(sp.input("Enter primary DNS"), InputError);
}
