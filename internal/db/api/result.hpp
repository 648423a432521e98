#pragma once

#include <string>

namespace quire::db {

/*
  Portable DB result codes.

  Backends translate driver errors into these. The restore path only
  needs to tell a duplicate-key collision (ConstraintViolation, the
  row is skipped) apart from everything else (fatal).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  // unique / primary key collision
  ConstraintViolation,
  // NOT NULL, CHECK, foreign key
  IntegrityViolation,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ErrorCodeName(ErrorCode code);

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

  std::string ToString() const {
    return message.empty() ? ErrorCodeName(code) : std::string(ErrorCodeName(code)) + ": " + message;
  }
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IntegrityViolation:
      return "integrity_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace quire::db
