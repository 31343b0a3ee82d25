#ifndef REVHIST_ERRORS_HPP
#define REVHIST_ERRORS_HPP

#include <arrow/status.h>

#include <string>
#include <utility>

namespace revhist {

/**
 * Failure categories reported by the history containers.
 * Each kind travels as a distinct arrow::StatusCode, so callers can either
 * use classify() or the usual arrow predicates (IsKeyError(), ...).
 */
enum class ErrorKind {
  NONE,
  // No value recorded at or before the queried revision
  NOT_FOUND,
  // Index or relative walk beyond either end of a chain
  OUT_OF_RANGE,
  // Assignment below the window tail, or duplicate revisions in a batch
  ORDERING_VIOLATION,
  // Internal structure found inconsistent; indicates a bug
  INVARIANT_VIOLATION,
  OTHER
};

template <typename... Args>
arrow::Status not_found(Args&&... args) {
  return arrow::Status::KeyError(std::forward<Args>(args)...);
}

template <typename... Args>
arrow::Status out_of_range(Args&&... args) {
  return arrow::Status::IndexError(std::forward<Args>(args)...);
}

template <typename... Args>
arrow::Status ordering_violation(Args&&... args) {
  return arrow::Status::Invalid("ordering violation: ",
                                std::forward<Args>(args)...);
}

template <typename... Args>
arrow::Status invariant_violation(Args&&... args) {
  return arrow::Status::UnknownError("invariant violation: ",
                                     std::forward<Args>(args)...);
}

ErrorKind classify(const arrow::Status& status);

std::string to_string(ErrorKind kind);

}  // namespace revhist

#endif  // REVHIST_ERRORS_HPP
