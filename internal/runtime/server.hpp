#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace netorch::runtime {

/*
  Owns the gRPC listener and the service adapters registered on it.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // Stops accepting requests and drains in-flight calls.
  void Stop();

  // Port actually bound (useful with "host:0")
  int SelectedPort() const {
    return selected_port_;
  }

private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace netorch::runtime
