#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "agentpay/settlement/v1/settlement_service.grpc.pb.h"
#include "internal/auth/access_policy.hpp"
#include "internal/service/settlement_service.hpp"

namespace agentpay::grpc {

class SettlementServer final : public agentpay::settlement::v1::SettlementService::Service {
 public:
  SettlementServer(std::shared_ptr<agentpay::service::SettlementService> svc, std::shared_ptr<const auth::AccessPolicy> access);

  ::grpc::Status Settle(::grpc::ServerContext* context, const agentpay::settlement::v1::SettleRequest* req, agentpay::settlement::v1::SettleResponse* resp) override;

  ::grpc::Status HasAccess(::grpc::ServerContext* context, const agentpay::settlement::v1::HasAccessRequest* req, agentpay::settlement::v1::HasAccessResponse* resp) override;

  ::grpc::Status GetEntitlement(::grpc::ServerContext* context, const agentpay::settlement::v1::GetEntitlementRequest* req, agentpay::settlement::v1::GetEntitlementResponse* resp) override;

  ::grpc::Status ConsumeCall(::grpc::ServerContext* context, const agentpay::settlement::v1::ConsumeCallRequest* req, agentpay::settlement::v1::ConsumeCallResponse* resp) override;

 private:
  std::shared_ptr<agentpay::service::SettlementService> service_;
  std::shared_ptr<const auth::AccessPolicy>    access_;
};

} // namespace agentpay::grpc
