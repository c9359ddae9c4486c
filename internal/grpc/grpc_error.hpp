#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace agentpay::grpc {

/*
  Maps settlement errors onto gRPC status.

  error_details carries util::ErrorReason(e), with the pull failure reason
  appended for funds errors ("funds_pull:insufficient_funds"). Unrecognized
  exceptions are logged and reach the client only as INTERNAL "internal error".
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace agentpay::grpc
