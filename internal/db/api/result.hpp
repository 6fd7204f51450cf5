#pragma once

#include <string>
#include <string_view>

namespace workflow::db {

/*
  Portable DB result codes.

  Backends translate driver errors (sqlite rc, pqxx exceptions) into
  these; nothing above internal/db sees a driver type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  // Connection lost / database unreachable.
  Unavailable,
  IOError,
  Corruption,

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

std::string_view ToString(ErrorCode code);

/*
  Maps a failed Result onto the util exception taxonomy:
    NotFound       -> util::NotFound
    AlreadyExists /
    Constraint     -> util::AlreadyExists
    everything else-> util::StoreUnavailable
*/
void ThrowIfDbError(const Result& result, std::string_view context);

} // namespace workflow::db
