#pragma once

#include <cstdint>
#include <string>

namespace offline::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // rows touched by the statement (writes only)
  uint64_t rows_affected = 0;

  static Result Ok(uint64_t rows = 0) {
    Result r;
    r.rows_affected = rows;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
}

} // namespace offline::db
