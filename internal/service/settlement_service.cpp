#include "settlement_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::service {

using namespace agentpay::settlement::v1;

namespace {

void ToProto(const db::model::EntitlementRecord& record, Entitlement* out) {
  out->set_agent_id(record.agent_id);
  out->set_payer(record.payer);
  out->set_call_credits(record.call_credits);
  out->set_valid_until(record.valid_until);
}

} // namespace

SettlementService::SettlementService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SettleResponse SettlementService::Settle(const auth::Principal& caller, const SettleRequest& req) {
  return ObserveRpc("SettlementService.Settle", caller.name, [&] {
    if (!req.has_receipt()) {
      throw util::InvalidArgument("receipt is required");
    }
    if (!req.has_authorization()) {
      throw util::InvalidArgument("authorization is required");
    }

    const auto result = ctx_.engine->Settle(caller, req.receipt(), req.authorization());

    SettleResponse resp;
    resp.set_payment_id(result.payment_id);
    ToProto(result.entitlement, resp.mutable_entitlement());
    resp.set_beneficiary(result.beneficiary);
    resp.set_net(result.net);
    resp.set_fee(result.fee);
    return resp;
  });
}

HasAccessResponse SettlementService::HasAccess(const HasAccessRequest& req) {
  return ObserveRpc("SettlementService.HasAccess", "", [&] {
    HasAccessResponse resp;
    resp.set_has_access(ctx_.engine->HasAccess(req.agent_id(), req.payer()));
    return resp;
  });
}

GetEntitlementResponse SettlementService::GetEntitlement(const GetEntitlementRequest& req) {
  return ObserveRpc("SettlementService.GetEntitlement", "", [&] {
    GetEntitlementResponse resp;
    ToProto(ctx_.engine->GetEntitlement(req.agent_id(), req.payer()), resp.mutable_entitlement());
    return resp;
  });
}

ConsumeCallResponse SettlementService::ConsumeCall(const auth::Principal& caller, const ConsumeCallRequest& req) {
  return ObserveRpc("SettlementService.ConsumeCall", caller.name, [&] {
    ConsumeCallResponse resp;
    ToProto(ctx_.engine->ConsumeCall(caller, req.agent_id(), req.payer()), resp.mutable_entitlement());
    return resp;
  });
}

} // namespace agentpay::service
