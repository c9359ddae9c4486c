#include "revenue_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"

namespace agentpay::service {

using namespace agentpay::settlement::v1;

RevenueService::RevenueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WithdrawResponse RevenueService::Withdraw(const auth::Principal& caller, const WithdrawRequest& req) {
  return ObserveRpc("RevenueService.Withdraw", caller.name, [&] {
    WithdrawResponse resp;
    resp.set_remaining_balance(ctx_.engine->Withdraw(caller, req.to(), req.amount()));
    return resp;
  });
}

GetBalanceResponse RevenueService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("RevenueService.GetBalance", "", [&] {
    GetBalanceResponse resp;
    resp.set_balance(ctx_.engine->BalanceOf(req.beneficiary()));
    return resp;
  });
}

} // namespace agentpay::service
