#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "internal/factory.hpp"

namespace agentpay::runtime {

// gRPC adapters for every service in the runtime.
std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const agentpay::factory::RuntimeDependencies& deps);

class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; useful when bind_address ends in ":0".
  int SelectedPort() const {
    return selected_port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace agentpay::runtime
