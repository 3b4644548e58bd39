#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "netorch/v1/orchestrator_service.grpc.pb.h"
#include "internal/service/orchestrator_service.hpp"

namespace netorch::grpc {

class OrchestratorServer final : public netorch::v1::OrchestratorService::Service {
public:
  explicit OrchestratorServer(std::shared_ptr<netorch::service::OrchestratorService> svc);

  ::grpc::Status CreateDeployment(::grpc::ServerContext*, const netorch::v1::CreateDeploymentRequest*,
                                  netorch::v1::CreateDeploymentResponse*) override;
  ::grpc::Status ListDeployments(::grpc::ServerContext*, const netorch::v1::ListDeploymentsRequest*,
                                 netorch::v1::ListDeploymentsResponse*) override;
  ::grpc::Status GetDeployment(::grpc::ServerContext*, const netorch::v1::GetDeploymentRequest*,
                               netorch::v1::GetDeploymentResponse*) override;
  ::grpc::Status DeleteDeployment(::grpc::ServerContext*, const netorch::v1::DeleteDeploymentRequest*,
                                  netorch::v1::DeleteDeploymentResponse*) override;
  ::grpc::Status ListNodes(::grpc::ServerContext*, const netorch::v1::ListNodesRequest*,
                           netorch::v1::ListNodesResponse*) override;
  ::grpc::Status ListTelemetry(::grpc::ServerContext*, const netorch::v1::ListTelemetryRequest*,
                               netorch::v1::ListTelemetryResponse*) override;
  ::grpc::Status ListEvents(::grpc::ServerContext*, const netorch::v1::ListEventsRequest*,
                            netorch::v1::ListEventsResponse*) override;
  ::grpc::Status GetBottlenecks(::grpc::ServerContext*, const netorch::v1::GetBottlenecksRequest*,
                                netorch::v1::GetBottlenecksResponse*) override;
  ::grpc::Status Health(::grpc::ServerContext*, const netorch::v1::HealthRequest*,
                        netorch::v1::HealthResponse*) override;

private:
  std::shared_ptr<netorch::service::OrchestratorService> service_;
};

}
