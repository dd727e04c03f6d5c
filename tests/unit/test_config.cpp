#include "common/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace dnsc::common;

namespace {

void clearAllDnscEnv() {
  const char* vVars[] = {
      "DNSC_LOG_LEVEL",      "DNSC_NMCLI_BIN",          "DNSC_RESOLVECTL_BIN",
      "DNSC_ELEVATE_CMD",    "DNSC_PROVIDERS_FILE",     "DNSC_VALIDATE_ADDRESSES",
      "DNSC_EXIT_CODE",      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllDnscEnv(); }
  void TearDown() override { clearAllDnscEnv(); }
};

TEST_F(ConfigTest, EmptyEnvironmentGivesDefaults) {
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sLogLevel, "warn");
  EXPECT_EQ(cfg.sNmcliBin, "nmcli");
  EXPECT_EQ(cfg.sResolvectlBin, "resolvectl");
  EXPECT_EQ(cfg.vElevateCmd, (std::vector<std::string>{"sudo"}));
  EXPECT_FALSE(cfg.oProvidersFile.has_value());
  EXPECT_FALSE(cfg.bValidateAddresses);
  EXPECT_EQ(cfg.iExitCode, 0);
}

TEST_F(ConfigTest, OverrideDefaults) {
  setenv("DNSC_LOG_LEVEL", "debug", 1);
  setenv("DNSC_NMCLI_BIN", "/usr/local/bin/nmcli", 1);
  setenv("DNSC_RESOLVECTL_BIN", "systemd-resolve", 1);
  setenv("DNSC_ELEVATE_CMD", "doas", 1);
  setenv("DNSC_PROVIDERS_FILE", "/etc/dnsc/providers.json", 1);
  setenv("DNSC_VALIDATE_ADDRESSES", "yes", 1);
  setenv("DNSC_EXIT_CODE", "1", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_EQ(cfg.sNmcliBin, "/usr/local/bin/nmcli");
  EXPECT_EQ(cfg.sResolvectlBin, "systemd-resolve");
  EXPECT_EQ(cfg.vElevateCmd, (std::vector<std::string>{"doas"}));
  ASSERT_TRUE(cfg.oProvidersFile.has_value());
  EXPECT_EQ(*cfg.oProvidersFile, "/etc/dnsc/providers.json");
  EXPECT_TRUE(cfg.bValidateAddresses);
  EXPECT_EQ(cfg.iExitCode, 1);
}

TEST_F(ConfigTest, EmptyElevateCmdDisablesElevation) {
  setenv("DNSC_ELEVATE_CMD", "", 1);
  auto cfg = Config::load();
  EXPECT_TRUE(cfg.vElevateCmd.empty());

  setenv("DNSC_ELEVATE_CMD", "  \t ", 1);
  EXPECT_TRUE(Config::load().vElevateCmd.empty());
}

TEST_F(ConfigTest, ElevateCmdIsSplitIntoWords) {
  setenv("DNSC_ELEVATE_CMD", "pkexec  --user\troot", 1);
  auto cfg = Config::load();
  EXPECT_EQ(cfg.vElevateCmd, (std::vector<std::string>{"pkexec", "--user", "root"}));
}

TEST_F(ConfigTest, ThrowsOnEmptyNmcliBin) {
  setenv("DNSC_NMCLI_BIN", "", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnUnknownLogLevel) {
  setenv("DNSC_LOG_LEVEL", "loud", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, AcceptsOffLogLevel) {
  setenv("DNSC_LOG_LEVEL", "off", 1);
  EXPECT_EQ(Config::load().sLogLevel, "off");
}

TEST_F(ConfigTest, ThrowsOnNonNumericExitCode) {
  setenv("DNSC_EXIT_CODE", "one", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnTrailingGarbageInExitCode) {
  setenv("DNSC_EXIT_CODE", "1x", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ExitCodeMustFitProcessStatus) {
  setenv("DNSC_EXIT_CODE", "256", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
  setenv("DNSC_EXIT_CODE", "-1", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnInvalidBoolean) {
  setenv("DNSC_VALIDATE_ADDRESSES", "maybe", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}
