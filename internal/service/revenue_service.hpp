#pragma once

#include "agentpay/settlement/v1/revenue_service.pb.h"
#include "internal/auth/access_policy.hpp"
#include "service_context.hpp"

namespace agentpay::service {

class RevenueService {
 public:
  explicit RevenueService(ServiceContext ctx);

  agentpay::settlement::v1::WithdrawResponse Withdraw(const auth::Principal& caller, const agentpay::settlement::v1::WithdrawRequest& req);

  agentpay::settlement::v1::GetBalanceResponse GetBalance(const agentpay::settlement::v1::GetBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace agentpay::service
