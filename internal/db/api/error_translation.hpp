#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace songqueue::db {

/*
  Maps portable DB codes onto the typed errors of the queue core.

    Conflict             -> InvalidTransition (optimistic status check lost)
    ConstraintViolation  -> Duplicate         (outstanding patron/track index)
    AlreadyExists        -> Duplicate
    NotFound             -> NotFound
    everything else      -> StorageError      (nothing was committed)
*/

[[noreturn]] inline void ThrowTranslated(ErrorCode code, const std::string& message) {
  switch (code) {
    case ErrorCode::Conflict:
      throw songqueue::util::InvalidTransition(message);
    case ErrorCode::ConstraintViolation:
    case ErrorCode::AlreadyExists:
      throw songqueue::util::Duplicate(message);
    case ErrorCode::NotFound:
      throw songqueue::util::NotFound(message);
    default:
      throw songqueue::util::StorageError(message);
  }
}

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }
  ThrowTranslated(result.code, result.message.empty() ? context : context + ": " + result.message);
}

// Runs fn, translating DatabaseError from read paths and transaction control.
template <typename Fn>
auto WithStorage(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DatabaseError& e) {
    ThrowTranslated(e.Code(), context + ": " + e.what());
  }
}

} // namespace songqueue::db
