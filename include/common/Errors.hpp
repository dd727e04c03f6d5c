#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dnsc::common {

/// Base error for all application-level exceptions.
/// Carries a machine-readable error code slug.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Active connection could not be determined. Fatal at startup.
struct DiscoveryError : AppError {
  explicit DiscoveryError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// External tool exited non-zero or could not be started.
/// Carries the exit status and the captured diagnostic text.
struct CommandError : AppError {
  int _iExitCode;
  std::string _sDiagnostic;

  explicit CommandError(std::string sCode, std::string sMsg, int iExitCode = -1,
                        std::string sDiagnostic = {})
      : AppError(std::move(sCode), std::move(sMsg)),
        _iExitCode(iExitCode),
        _sDiagnostic(std::move(sDiagnostic)) {}
};

/// Interactive prompt could not be read.
struct InputError : AppError {
  bool _bEndOfInput;

  explicit InputError(std::string sCode, std::string sMsg, bool bEndOfInput = false)
      : AppError(std::move(sCode), std::move(sMsg)), _bEndOfInput(bEndOfInput) {}
};

/// Input rejected before reaching the network manager.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Provider catalog file could not be read or parsed.
struct CatalogError : AppError {
  explicit CatalogError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace dnsc::common
