#include "admin_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/service/observe_rpc.hpp"

namespace agentpay::service {

using namespace agentpay::settlement::v1;

namespace {

// ListEvents page size when the request leaves max_events unset
constexpr uint32_t kDefaultEventPage = 100;
constexpr uint32_t kMaxEventPage     = 1000;

FeeConfigResponse ToResponse(const db::model::FeeConfigRecord& record) {
  FeeConfigResponse resp;
  resp.mutable_fee_config()->set_fee_basis_points(record.fee_basis_points);
  resp.mutable_fee_config()->set_treasury(record.treasury);
  return resp;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FeeConfigResponse AdminService::SetFeeBasisPoints(const auth::Principal& caller, const SetFeeBasisPointsRequest& req) {
  return ObserveRpc("AdminService.SetFeeBasisPoints", caller.name,
                    [&] { return ToResponse(ctx_.engine->SetFeeBasisPoints(caller, req.fee_basis_points())); });
}

FeeConfigResponse AdminService::SetTreasury(const auth::Principal& caller, const SetTreasuryRequest& req) {
  return ObserveRpc("AdminService.SetTreasury", caller.name, [&] { return ToResponse(ctx_.engine->SetTreasury(caller, req.treasury())); });
}

FeeConfigResponse AdminService::GetFeeConfig(const GetFeeConfigRequest&) {
  return ObserveRpc("AdminService.GetFeeConfig", "", [&] { return ToResponse(ctx_.engine->GetFeeConfig()); });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    const auto stats = ctx_.engine->Stats();

    StatsResponse resp;
    resp.set_consumed_payments(stats.consumed_payments);
    resp.set_entitlement_records(stats.entitlement_records);
    resp.set_beneficiaries(stats.beneficiaries);
    resp.set_outstanding_revenue(stats.outstanding_revenue);
    resp.set_last_event_sequence(stats.last_event_sequence);
    return resp;
  });
}

ListEventsResponse AdminService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("AdminService.ListEvents", "", [&] {
    uint32_t page = req.max_events() == 0 ? kDefaultEventPage : req.max_events();
    page          = std::min(page, kMaxEventPage);

    ListEventsResponse resp;
    for (auto& event : ctx_.engine->ListEvents(req.after_sequence(), page)) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

} // namespace agentpay::service
