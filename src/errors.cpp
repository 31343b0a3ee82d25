#include "errors.hpp"

namespace revhist {

ErrorKind classify(const arrow::Status& status) {
  if (status.ok()) {
    return ErrorKind::NONE;
  }
  switch (status.code()) {
    case arrow::StatusCode::KeyError:
      return ErrorKind::NOT_FOUND;
    case arrow::StatusCode::IndexError:
      return ErrorKind::OUT_OF_RANGE;
    case arrow::StatusCode::Invalid:
      return ErrorKind::ORDERING_VIOLATION;
    case arrow::StatusCode::UnknownError:
      return ErrorKind::INVARIANT_VIOLATION;
    default:
      return ErrorKind::OTHER;
  }
}

std::string to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::NOT_FOUND:
      return "NotFound";
    case ErrorKind::OUT_OF_RANGE:
      return "OutOfRange";
    case ErrorKind::ORDERING_VIOLATION:
      return "OrderingViolation";
    case ErrorKind::INVARIANT_VIOLATION:
      return "InvariantViolation";
    case ErrorKind::OTHER:
      return "Other";
  }
  return "Unknown";
}

}  // namespace revhist
