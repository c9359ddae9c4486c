#include "server.hpp"

#include <stdexcept>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/grpc/revenue_server.hpp"
#include "internal/grpc/settlement_server.hpp"
#include "internal/observability/logging.hpp"

namespace agentpay::runtime {

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const agentpay::factory::RuntimeDependencies& deps) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<agentpay::grpc::SettlementServer>(deps.settlement_service, deps.access));
  services.push_back(std::make_unique<agentpay::grpc::RevenueServer>(deps.revenue_service, deps.access));
  services.push_back(std::make_unique<agentpay::grpc::AdminServer>(deps.admin_service, deps.access));
  services.push_back(std::make_unique<agentpay::grpc::RegistryServer>(deps.registry_service, deps.access));
  return services;
}

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (bind_address_.empty()) {
    throw std::runtime_error("server.bind_address is required");
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  AGENTPAY_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                              observability::IntField("port", selected_port_),
                                              observability::UintField("services", services_.size())});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace agentpay::runtime
