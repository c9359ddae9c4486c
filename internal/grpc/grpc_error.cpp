#include "grpc_error.hpp"

#include <string>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::grpc {

namespace {

::grpc::StatusCode CodeForReason(const std::string& reason) {
  static const std::unordered_map<std::string, ::grpc::StatusCode> kCodes = {
      {"replay", ::grpc::StatusCode::ALREADY_EXISTS},
      {"already_exists", ::grpc::StatusCode::ALREADY_EXISTS},
      {"inactive_sku", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"sku_mismatch", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"wrong_token", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"amount_mismatch", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"invalid_payer", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"fee_too_high", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"invalid_argument", ::grpc::StatusCode::INVALID_ARGUMENT},
      {"funds_pull", ::grpc::StatusCode::FAILED_PRECONDITION},
      {"no_credits", ::grpc::StatusCode::FAILED_PRECONDITION},
      {"insufficient_balance", ::grpc::StatusCode::FAILED_PRECONDITION},
      {"invalid_state", ::grpc::StatusCode::FAILED_PRECONDITION},
      {"transfer_failed", ::grpc::StatusCode::ABORTED},
      {"not_found", ::grpc::StatusCode::NOT_FOUND},
      {"permission_denied", ::grpc::StatusCode::PERMISSION_DENIED},
      {"unauthenticated", ::grpc::StatusCode::UNAUTHENTICATED},
  };
  const auto it = kCodes.find(reason);
  return it == kCodes.end() ? ::grpc::StatusCode::INTERNAL : it->second;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto reason = util::ErrorReason(e);
  const auto code   = CodeForReason(reason);

  if (code == ::grpc::StatusCode::INTERNAL) {
    AGENTPAY_LOG_ERROR("unmapped error surfaced to client", {observability::StringField("error", e.what())});
    return {code, "internal error", reason};
  }

  if (const auto* pull = dynamic_cast<const util::FundsPullError*>(&e)) {
    return {code, e.what(), reason + ":" + pull->reason()};
  }
  return {code, e.what(), reason};
}

} // namespace agentpay::grpc
