#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "agentpay/settlement/v1/revenue_service.grpc.pb.h"
#include "internal/auth/access_policy.hpp"
#include "internal/service/revenue_service.hpp"

namespace agentpay::grpc {

class RevenueServer final : public agentpay::settlement::v1::RevenueService::Service {
 public:
  RevenueServer(std::shared_ptr<agentpay::service::RevenueService> svc, std::shared_ptr<const auth::AccessPolicy> access);

  ::grpc::Status Withdraw(::grpc::ServerContext* context, const agentpay::settlement::v1::WithdrawRequest* req, agentpay::settlement::v1::WithdrawResponse* resp) override;

  ::grpc::Status GetBalance(::grpc::ServerContext* context, const agentpay::settlement::v1::GetBalanceRequest* req, agentpay::settlement::v1::GetBalanceResponse* resp) override;

 private:
  std::shared_ptr<agentpay::service::RevenueService> service_;
  std::shared_ptr<const auth::AccessPolicy>    access_;
};

} // namespace agentpay::grpc
