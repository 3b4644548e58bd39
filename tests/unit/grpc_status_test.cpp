#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/analytics/bottleneck_detector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "netorch/v1.hpp"

namespace {

std::unique_ptr<netorch::grpc::OrchestratorServer> BuildServer() {
  netorch::service::ServiceContext ctx;
  auto repository = std::make_shared<netorch::db::memory::MemoryRepository>();
  ctx.repository  = repository;
  ctx.detector    = std::make_shared<netorch::analytics::BottleneckDetector>(repository);
  return std::make_unique<netorch::grpc::OrchestratorServer>(std::make_shared<netorch::service::OrchestratorService>(ctx));
}

void TestErrorMapping() {
  assert(netorch::grpc::ToStatus(netorch::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(netorch::grpc::ToStatus(netorch::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(netorch::grpc::ToStatus(netorch::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(netorch::grpc::ToStatus(netorch::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(netorch::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestGetMissingDeploymentReturnsNotFound() {
  auto server = BuildServer();

  netorch::v1::GetDeploymentRequest req;
  req.set_deployment_id(7);
  netorch::v1::GetDeploymentResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server->GetDeployment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCreateWithZeroNodesReturnsInvalidArgument() {
  auto server = BuildServer();

  netorch::v1::CreateDeploymentRequest req;
  req.set_name("fabric");
  req.set_target_node_count(0);
  netorch::v1::CreateDeploymentResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server->CreateDeployment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCreateThenGetSucceeds() {
  auto server = BuildServer();

  netorch::v1::CreateDeploymentRequest create_req;
  create_req.set_name("fabric");
  create_req.set_target_node_count(4);
  netorch::v1::CreateDeploymentResponse create_resp;
  ::grpc::ServerContext                 create_ctx;
  assert(server->CreateDeployment(&create_ctx, &create_req, &create_resp).ok());

  netorch::v1::GetDeploymentRequest get_req;
  get_req.set_deployment_id(create_resp.deployment().id());
  netorch::v1::GetDeploymentResponse get_resp;
  ::grpc::ServerContext              get_ctx;
  assert(server->GetDeployment(&get_ctx, &get_req, &get_resp).ok());
  assert(get_resp.current_node_count() == 4);
}

} // namespace

int main() {
  TestErrorMapping();
  TestGetMissingDeploymentReturnsNotFound();
  TestCreateWithZeroNodesReturnsInvalidArgument();
  TestCreateThenGetSucceeds();

  std::cout << "netorch_unit_grpc_status: pass\n";
  return 0;
}
