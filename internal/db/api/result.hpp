#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace draft::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  Unsupported,
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

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

/*
  Translates a failed repository result into the engine's exception types.
*/
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) return;

  std::string message = context + ": " + ToString(result.code);
  if (!result.message.empty()) message += " (" + result.message + ")";

  switch (result.code) {
    case ErrorCode::NotFound: throw util::NotFound(message);
    case ErrorCode::AlreadyExists: throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation: throw util::InvalidState(message);
    default: throw std::runtime_error(message);
  }
}

} // namespace draft::db
