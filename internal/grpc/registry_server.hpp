#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "agentpay/settlement/v1/registry_service.grpc.pb.h"
#include "internal/auth/access_policy.hpp"
#include "internal/service/registry_service.hpp"

namespace agentpay::grpc {

class RegistryServer final : public agentpay::settlement::v1::RegistryService::Service {
 public:
  RegistryServer(std::shared_ptr<agentpay::service::RegistryService> svc, std::shared_ptr<const auth::AccessPolicy> access);

  ::grpc::Status RegisterAgent(::grpc::ServerContext* context, const agentpay::settlement::v1::RegisterAgentRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) override;

  ::grpc::Status TransferAgent(::grpc::ServerContext* context, const agentpay::settlement::v1::TransferAgentRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) override;

  ::grpc::Status GetOwner(::grpc::ServerContext* context, const agentpay::settlement::v1::GetOwnerRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) override;

  ::grpc::Status CreateSku(::grpc::ServerContext* context, const agentpay::settlement::v1::CreateSkuRequest* req, agentpay::settlement::v1::SkuResponse* resp) override;

  ::grpc::Status SetSkuActive(::grpc::ServerContext* context, const agentpay::settlement::v1::SetSkuActiveRequest* req, agentpay::settlement::v1::SkuResponse* resp) override;

  ::grpc::Status GetSku(::grpc::ServerContext* context, const agentpay::settlement::v1::GetSkuRequest* req, agentpay::settlement::v1::SkuResponse* resp) override;

  ::grpc::Status FundAccount(::grpc::ServerContext* context, const agentpay::settlement::v1::FundAccountRequest* req, agentpay::settlement::v1::TokenBalanceResponse* resp) override;

  ::grpc::Status GetTokenBalance(::grpc::ServerContext* context, const agentpay::settlement::v1::GetTokenBalanceRequest* req, agentpay::settlement::v1::TokenBalanceResponse* resp) override;

 private:
  std::shared_ptr<agentpay::service::RegistryService> service_;
  std::shared_ptr<const auth::AccessPolicy>    access_;
};

} // namespace agentpay::grpc
