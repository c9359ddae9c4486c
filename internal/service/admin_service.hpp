#pragma once

#include "agentpay/settlement/v1/admin_service.pb.h"
#include "internal/auth/access_policy.hpp"
#include "service_context.hpp"

namespace agentpay::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  agentpay::settlement::v1::FeeConfigResponse SetFeeBasisPoints(const auth::Principal& caller,
                                                                const agentpay::settlement::v1::SetFeeBasisPointsRequest& req);

  agentpay::settlement::v1::FeeConfigResponse SetTreasury(const auth::Principal& caller, const agentpay::settlement::v1::SetTreasuryRequest& req);

  agentpay::settlement::v1::FeeConfigResponse GetFeeConfig(const agentpay::settlement::v1::GetFeeConfigRequest& req);

  agentpay::settlement::v1::StatsResponse Stats(const agentpay::settlement::v1::StatsRequest& req);

  agentpay::settlement::v1::ListEventsResponse ListEvents(const agentpay::settlement::v1::ListEventsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace agentpay::service
