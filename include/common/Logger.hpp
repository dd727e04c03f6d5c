#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dnsc::common {

/// Process-wide "dnsc" logger, installed as spdlog's default.
/// Writes to stderr so it never interleaves with the menu on stdout.
/// At the default "warn" level an ordinary session logs nothing; command
/// lines and ignored failures appear from "debug" on.
///
///   Logger::init(cfg.sLogLevel);
///   Logger::get()->debug("Running {}", sCommand);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace dnsc::common
