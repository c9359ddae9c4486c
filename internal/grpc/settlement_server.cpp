#include "settlement_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace agentpay::grpc {

SettlementServer::SettlementServer(std::shared_ptr<agentpay::service::SettlementService> svc, std::shared_ptr<const auth::AccessPolicy> access)
    : service_(std::move(svc)), access_(std::move(access)) {
}

::grpc::Status SettlementServer::Settle(::grpc::ServerContext* context, const agentpay::settlement::v1::SettleRequest* req, agentpay::settlement::v1::SettleResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->Settle(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::HasAccess(::grpc::ServerContext*, const agentpay::settlement::v1::HasAccessRequest* req, agentpay::settlement::v1::HasAccessResponse* resp) {
  try {
    *resp = service_->HasAccess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::GetEntitlement(::grpc::ServerContext*, const agentpay::settlement::v1::GetEntitlementRequest* req, agentpay::settlement::v1::GetEntitlementResponse* resp) {
  try {
    *resp = service_->GetEntitlement(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SettlementServer::ConsumeCall(::grpc::ServerContext* context, const agentpay::settlement::v1::ConsumeCallRequest* req, agentpay::settlement::v1::ConsumeCallResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->ConsumeCall(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace agentpay::grpc
