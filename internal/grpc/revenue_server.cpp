#include "revenue_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace agentpay::grpc {

RevenueServer::RevenueServer(std::shared_ptr<agentpay::service::RevenueService> svc, std::shared_ptr<const auth::AccessPolicy> access)
    : service_(std::move(svc)), access_(std::move(access)) {
}

::grpc::Status RevenueServer::Withdraw(::grpc::ServerContext* context, const agentpay::settlement::v1::WithdrawRequest* req, agentpay::settlement::v1::WithdrawResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->Withdraw(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RevenueServer::GetBalance(::grpc::ServerContext*, const agentpay::settlement::v1::GetBalanceRequest* req, agentpay::settlement::v1::GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace agentpay::grpc
