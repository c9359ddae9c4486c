#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "agentpay/settlement/v1/admin_service.grpc.pb.h"
#include "internal/auth/access_policy.hpp"
#include "internal/service/admin_service.hpp"

namespace agentpay::grpc {

class AdminServer final : public agentpay::settlement::v1::AdminService::Service {
 public:
  AdminServer(std::shared_ptr<agentpay::service::AdminService> svc, std::shared_ptr<const auth::AccessPolicy> access);

  ::grpc::Status SetFeeBasisPoints(::grpc::ServerContext* context, const agentpay::settlement::v1::SetFeeBasisPointsRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) override;

  ::grpc::Status SetTreasury(::grpc::ServerContext* context, const agentpay::settlement::v1::SetTreasuryRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) override;

  ::grpc::Status GetFeeConfig(::grpc::ServerContext* context, const agentpay::settlement::v1::GetFeeConfigRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) override;

  ::grpc::Status Stats(::grpc::ServerContext* context, const agentpay::settlement::v1::StatsRequest* req, agentpay::settlement::v1::StatsResponse* resp) override;

  ::grpc::Status ListEvents(::grpc::ServerContext* context, const agentpay::settlement::v1::ListEventsRequest* req, agentpay::settlement::v1::ListEventsResponse* resp) override;

 private:
  std::shared_ptr<agentpay::service::AdminService> service_;
  std::shared_ptr<const auth::AccessPolicy>    access_;
};

} // namespace agentpay::grpc
