#include "registry_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace agentpay::grpc {

RegistryServer::RegistryServer(std::shared_ptr<agentpay::service::RegistryService> svc, std::shared_ptr<const auth::AccessPolicy> access)
    : service_(std::move(svc)), access_(std::move(access)) {
}

::grpc::Status RegistryServer::RegisterAgent(::grpc::ServerContext* context, const agentpay::settlement::v1::RegisterAgentRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->RegisterAgent(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::TransferAgent(::grpc::ServerContext* context, const agentpay::settlement::v1::TransferAgentRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->TransferAgent(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetOwner(::grpc::ServerContext*, const agentpay::settlement::v1::GetOwnerRequest* req, agentpay::settlement::v1::AgentOwnerResponse* resp) {
  try {
    *resp = service_->GetOwner(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::CreateSku(::grpc::ServerContext* context, const agentpay::settlement::v1::CreateSkuRequest* req, agentpay::settlement::v1::SkuResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->CreateSku(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::SetSkuActive(::grpc::ServerContext* context, const agentpay::settlement::v1::SetSkuActiveRequest* req, agentpay::settlement::v1::SkuResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->SetSkuActive(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetSku(::grpc::ServerContext*, const agentpay::settlement::v1::GetSkuRequest* req, agentpay::settlement::v1::SkuResponse* resp) {
  try {
    *resp = service_->GetSku(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::FundAccount(::grpc::ServerContext* context, const agentpay::settlement::v1::FundAccountRequest* req, agentpay::settlement::v1::TokenBalanceResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->FundAccount(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetTokenBalance(::grpc::ServerContext*, const agentpay::settlement::v1::GetTokenBalanceRequest* req, agentpay::settlement::v1::TokenBalanceResponse* resp) {
  try {
    *resp = service_->GetTokenBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace agentpay::grpc
