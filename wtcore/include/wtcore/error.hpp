// Copyright (c) 2025 <Your Name>
/**
 * @file error.hpp
 * @brief Error taxonomy shared by the engine and its callers.
 */
#pragma once

#include <string>
#include <utility>

namespace wtcore {

/**
 * @brief Classification of an operation result.
 *
 * Validation, State and Range conditions are reported to the user but are
 * not process failures. Config, NotFound and Io are fatal for an invocation.
 */
enum class ErrorCode {
  kOk,          ///< Operation applied
  kValidation,  ///< Malformed input or an edit that breaks a value floor
  kState,       ///< Operation not valid for the current status (no-op)
  kRange,       ///< Cycle index outside the valid range
  kConfig,      ///< Required configuration missing
  kNotFound,    ///< No persisted timer
  kIo,          ///< Storage read/write/decode failure
};

/** Returns a lowercase name for logging. */
const char* ToString(ErrorCode code);

/** Whether an invocation ending with this code should exit non-zero. */
inline bool IsFatal(ErrorCode code) {
  return code == ErrorCode::kConfig || code == ErrorCode::kNotFound ||
         code == ErrorCode::kIo;
}

/**
 * @brief Result of an engine operation.
 *
 * On success `message` carries the user-facing summary of what changed; on
 * failure it carries the explanation to show. Operations leave their input
 * untouched whenever the outcome is not ok.
 */
struct Outcome {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }

  static Outcome Applied(std::string msg) {
    return Outcome{ErrorCode::kOk, std::move(msg)};
  }
  static Outcome Fail(ErrorCode code, std::string msg) {
    return Outcome{code, std::move(msg)};
  }
};

}  // namespace wtcore
