#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace elevator::db {

// Failure classes shared by all backends; each maps its native codes here.
enum class ErrorCode {
  OK = 0,

  NotFound,       // no unit with that id
  AlreadyExists,  // unit id seeded twice
  Busy,           // store locked by another writer

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
};

constexpr std::string_view ToString(ErrorCode code) {
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
      return "internal_error";
  }
  return "unknown";
}

/*
  Outcome of a fleet or event-log write. Reads return the row (or nothing)
  directly.
*/
struct [[nodiscard]] Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "io_error: disk unavailable", or just the code when there is no message
  std::string Describe() const {
    std::string text(ToString(code));
    if (!message.empty()) text += ": " + message;
    return text;
  }
};

} // namespace elevator::db
