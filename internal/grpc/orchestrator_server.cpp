#include "orchestrator_server.hpp"

#include "grpc_error.hpp"

namespace netorch::grpc {

using namespace netorch::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

OrchestratorServer::OrchestratorServer(std::shared_ptr<netorch::service::OrchestratorService> svc) : service_(std::move(svc)) {
}

::grpc::Status OrchestratorServer::CreateDeployment(::grpc::ServerContext*, const CreateDeploymentRequest* req,
                                                    CreateDeploymentResponse* resp) {
  return Handle([&] { *resp = service_->CreateDeployment(*req); });
}

::grpc::Status OrchestratorServer::ListDeployments(::grpc::ServerContext*, const ListDeploymentsRequest* req,
                                                   ListDeploymentsResponse* resp) {
  return Handle([&] { *resp = service_->ListDeployments(*req); });
}

::grpc::Status OrchestratorServer::GetDeployment(::grpc::ServerContext*, const GetDeploymentRequest* req, GetDeploymentResponse* resp) {
  return Handle([&] { *resp = service_->GetDeployment(*req); });
}

::grpc::Status OrchestratorServer::DeleteDeployment(::grpc::ServerContext*, const DeleteDeploymentRequest* req,
                                                    DeleteDeploymentResponse* resp) {
  return Handle([&] { *resp = service_->DeleteDeployment(*req); });
}

::grpc::Status OrchestratorServer::ListNodes(::grpc::ServerContext*, const ListNodesRequest* req, ListNodesResponse* resp) {
  return Handle([&] { *resp = service_->ListNodes(*req); });
}

::grpc::Status OrchestratorServer::ListTelemetry(::grpc::ServerContext*, const ListTelemetryRequest* req, ListTelemetryResponse* resp) {
  return Handle([&] { *resp = service_->ListTelemetry(*req); });
}

::grpc::Status OrchestratorServer::ListEvents(::grpc::ServerContext*, const ListEventsRequest* req, ListEventsResponse* resp) {
  return Handle([&] { *resp = service_->ListEvents(*req); });
}

::grpc::Status OrchestratorServer::GetBottlenecks(::grpc::ServerContext*, const GetBottlenecksRequest* req,
                                                  GetBottlenecksResponse* resp) {
  return Handle([&] { *resp = service_->GetBottlenecks(*req); });
}

::grpc::Status OrchestratorServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  return Handle([&] { *resp = service_->Health(*req); });
}

} // namespace netorch::grpc
