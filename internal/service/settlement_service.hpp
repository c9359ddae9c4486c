#pragma once

#include "agentpay/settlement/v1/settlement_service.pb.h"
#include "internal/auth/access_policy.hpp"
#include "service_context.hpp"

namespace agentpay::service {

class SettlementService {
 public:
  explicit SettlementService(ServiceContext ctx);

  agentpay::settlement::v1::SettleResponse Settle(const auth::Principal& caller, const agentpay::settlement::v1::SettleRequest& req);

  agentpay::settlement::v1::HasAccessResponse HasAccess(const agentpay::settlement::v1::HasAccessRequest& req);

  agentpay::settlement::v1::GetEntitlementResponse GetEntitlement(const agentpay::settlement::v1::GetEntitlementRequest& req);

  agentpay::settlement::v1::ConsumeCallResponse ConsumeCall(const auth::Principal& caller,
                                                            const agentpay::settlement::v1::ConsumeCallRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace agentpay::service
