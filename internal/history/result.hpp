#pragma once

#include <string>

namespace chatrelay::history {

/*
  Portable store result codes.

  Store implementations translate backend errors into these; callers
  never see sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,
  ConstraintViolation,

  IOError,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace chatrelay::history
