#include "admin_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace agentpay::grpc {

AdminServer::AdminServer(std::shared_ptr<agentpay::service::AdminService> svc, std::shared_ptr<const auth::AccessPolicy> access)
    : service_(std::move(svc)), access_(std::move(access)) {
}

::grpc::Status AdminServer::SetFeeBasisPoints(::grpc::ServerContext* context, const agentpay::settlement::v1::SetFeeBasisPointsRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->SetFeeBasisPoints(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetTreasury(::grpc::ServerContext* context, const agentpay::settlement::v1::SetTreasuryRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) {
  try {
    const auto caller = ResolveCaller(*context, *access_);
    *resp             = service_->SetTreasury(caller, *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetFeeConfig(::grpc::ServerContext*, const agentpay::settlement::v1::GetFeeConfigRequest* req, agentpay::settlement::v1::FeeConfigResponse* resp) {
  try {
    *resp = service_->GetFeeConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const agentpay::settlement::v1::StatsRequest* req, agentpay::settlement::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListEvents(::grpc::ServerContext*, const agentpay::settlement::v1::ListEventsRequest* req, agentpay::settlement::v1::ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace agentpay::grpc
