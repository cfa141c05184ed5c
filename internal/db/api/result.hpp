#pragma once

#include <string>

namespace pipeline::db {

/*
  Outcome of a document write.

  Repositories map sqlite return codes and pqxx exceptions onto these
  codes; stores never see a driver error type.

  Conflict, Busy and SerializationFailure mean another writer got to the
  document first. The store replays the operation on those and treats
  everything else as fatal for the call.
*/

enum class ErrorCode {
  OK = 0,

  // lost a race against another writer
  Conflict,
  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

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

  bool LostRace() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  // "<code>: <message>"
  std::string Describe() const {
    return std::string(ToString(code)) + ": " + message;
  }
};

} // namespace pipeline::db
