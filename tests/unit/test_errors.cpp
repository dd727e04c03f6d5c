#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace dnsc::common;

TEST(ErrorsTest, AppErrorCarriesCode) {
  AppError err("internal_error", "Something went wrong");
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, CommandErrorCarriesStatusAndDiagnostic) {
  CommandError err("command_failed", "Command failed: boom", 10, "boom");
  EXPECT_EQ(err._sErrorCode, "command_failed");
  EXPECT_EQ(err._iExitCode, 10);
  EXPECT_EQ(err._sDiagnostic, "boom");
  EXPECT_STREQ(err.what(), "Command failed: boom");
}

TEST(ErrorsTest, CommandErrorDefaultsToUnknownStatus) {
  CommandError err("fork_failed", "fork() failed");
  EXPECT_EQ(err._iExitCode, -1);
  EXPECT_TRUE(err._sDiagnostic.empty());
}

TEST(ErrorsTest, InputErrorFlagsEndOfInput) {
  InputError errEof("end_of_input", "End of input", true);
  InputError errRead("read_failed", "Failed to read");
  EXPECT_TRUE(errEof._bEndOfInput);
  EXPECT_FALSE(errRead._bEndOfInput);
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw DiscoveryError("no_active_connection", "No active connection found");
  } catch (const AppError& err) {
    EXPECT_EQ(err._sErrorCode, "no_active_connection");
    EXPECT_STREQ(err.what(), "No active connection found");
  }

  try {
    throw ValidationError("invalid_address", "Not an IP address");
  } catch (const AppError& err) {
    EXPECT_EQ(err._sErrorCode, "invalid_address");
  }

  try {
    throw CatalogError("catalog_unreadable", "Cannot open");
  } catch (const AppError& err) {
    EXPECT_EQ(err._sErrorCode, "catalog_unreadable");
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw CommandError("restart_failed", "Failed to restart connection: no device");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "Failed to restart connection: no device");
  }
}
