#pragma once

#include "netorch/v1.hpp"
#include "service_context.hpp"

namespace netorch::service {

/*
  Request handling for the orchestrator API.

  Validation failures throw util::InvalidArgument, missing deployments
  util::NotFound. Every call is traced, metered and logged on failure.
*/
class OrchestratorService {
public:
  explicit OrchestratorService(ServiceContext ctx);

  netorch::v1::CreateDeploymentResponse CreateDeployment(const netorch::v1::CreateDeploymentRequest& req);
  netorch::v1::ListDeploymentsResponse ListDeployments(const netorch::v1::ListDeploymentsRequest& req);
  netorch::v1::GetDeploymentResponse GetDeployment(const netorch::v1::GetDeploymentRequest& req);
  netorch::v1::DeleteDeploymentResponse DeleteDeployment(const netorch::v1::DeleteDeploymentRequest& req);

  netorch::v1::ListNodesResponse ListNodes(const netorch::v1::ListNodesRequest& req);
  netorch::v1::ListTelemetryResponse ListTelemetry(const netorch::v1::ListTelemetryRequest& req);
  netorch::v1::ListEventsResponse ListEvents(const netorch::v1::ListEventsRequest& req);

  netorch::v1::GetBottlenecksResponse GetBottlenecks(const netorch::v1::GetBottlenecksRequest& req);

  netorch::v1::HealthResponse Health(const netorch::v1::HealthRequest& req);

private:
  ServiceContext ctx_;
};

}
