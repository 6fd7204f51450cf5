#include "result.hpp"

#include "internal/util/errors.hpp"

namespace workflow::db {

std::string_view ToString(ErrorCode code) {
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
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfDbError(const Result& result, std::string_view context) {
  if (result) {
    return;
  }

  std::string message(context);
  message += " (";
  message += ToString(result.code);
  message += ")";
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    default:
      throw util::StoreUnavailable(message);
  }
}

} // namespace workflow::db
