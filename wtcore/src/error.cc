// Copyright (c) 2025 <Your Name>
#include "wtcore/error.hpp"

namespace wtcore {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kValidation:
      return "validation";
    case ErrorCode::kState:
      return "state";
    case ErrorCode::kRange:
      return "range";
    case ErrorCode::kConfig:
      return "config";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kIo:
      return "io";
  }
  return "unknown";
}

}  // namespace wtcore
