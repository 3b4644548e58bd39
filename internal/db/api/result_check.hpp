#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace netorch::db {

// Raises the util:: exception matching a failed repository Result.
inline void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) return;

  switch (result.code) {
    case ErrorCode::NotFound:
      throw netorch::util::NotFound(prefix + ": " + result.message);
    case ErrorCode::AlreadyExists:
      throw netorch::util::AlreadyExists(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.message);
  }
}

} // namespace netorch::db
