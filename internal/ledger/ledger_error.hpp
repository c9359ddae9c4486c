#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::ledger {

// Turns a failed repository write into an exception at the ledger boundary.
inline void ThrowIfFailed(const db::Result& result, const std::string& what) {
  if (result) {
    return;
  }
  const std::string msg = what + ": " + db::ErrorCodeName(result.code) + (result.message.empty() ? "" : " (" + result.message + ")");
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(msg);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace agentpay::ledger
