#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace powerscore::db {

/*
  Outcome of a ranking-store write.

  Each backend maps its native failure (sqlite3 result code, pqxx
  exception type) onto an ErrorCode, so the batch writer, the result
  cache and the snapshot pruner never see driver types.
*/

enum class ErrorCode {
  OK = 0,

  // contention or a dropped link; the same chunk may go through later
  Busy,
  SerializationFailure,
  IOError,

  // the row itself was refused
  AlreadyExists,
  ConstraintViolation,

  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // "<code>: <message>", the form kept in write summaries and logs.
  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    return out;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace powerscore::db
