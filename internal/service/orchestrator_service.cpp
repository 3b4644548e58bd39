#include "orchestrator_service.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <string>
#include <type_traits>

#include "internal/analytics/bottleneck_detector.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/lifecycle/lifecycle_scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/telemetry/telemetry_generator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netorch::service {

using namespace netorch::v1;
using netorch::observability::IntField;
using netorch::observability::StringField;

namespace {

constexpr std::size_t kMaxNameLength      = 255;
constexpr uint32_t    kMaxNodesPerRequest = 1000;
constexpr uint32_t    kDefaultPageSize    = 100;
constexpr uint32_t    kMaxPageSize        = 1000;
constexpr uint32_t    kMaxWindowMinutes   = 60;

template <typename Fn>
auto ObserveRpc(std::string_view route, int64_t deployment_id, Fn&& fn) {
  netorch::observability::SpanScope span(route);
  if (deployment_id != 0) {
    span.SetAttribute("deployment.id", deployment_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    netorch::observability::Metrics::Instance().RecordRequest(route, success);
    netorch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NETORCH_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), IntField("deployment_id", deployment_id)});
    finish(false);
    throw;
  }
}

uint32_t ResolvePageSize(uint32_t requested, const char* what) {
  if (requested == 0) return kDefaultPageSize;
  if (requested > kMaxPageSize) {
    throw netorch::util::InvalidArgument(fmt::format("{}: limit must be between 1 and {}", what, kMaxPageSize));
  }
  return requested;
}

db::model::DeploymentRecord RequireDeployment(db::Repository& repository, db::Transaction& tx, int64_t deployment_id) {
  auto deployment = repository.GetDeployment(tx, deployment_id);
  if (!deployment) {
    throw netorch::util::NotFound(fmt::format("deployment {} not found", deployment_id));
  }
  return *deployment;
}

Deployment ToProto(const db::model::DeploymentRecord& r) {
  Deployment out;
  out.set_id(r.id);
  out.set_name(r.name);
  out.set_description(r.description);
  out.set_target_node_count(r.target_node_count);
  *out.mutable_created_at() = util::MillisToProto(r.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(r.updated_at_ms);
  return out;
}

Node ToProto(const db::model::NodeRecord& r) {
  Node out;
  out.set_id(r.id);
  out.set_deployment_id(r.deployment_id);
  out.set_node_id(r.node_id);
  out.set_state(netorch::model::ToProto(r.state));
  out.set_hostname(r.hostname);
  if (r.ip_address) out.set_ip_address(*r.ip_address);
  *out.mutable_created_at()       = util::MillisToProto(r.created_at_ms);
  *out.mutable_updated_at()       = util::MillisToProto(r.updated_at_ms);
  *out.mutable_state_changed_at() = util::MillisToProto(r.state_changed_at_ms);
  return out;
}

TelemetrySample ToProto(const db::model::TelemetrySampleRecord& r) {
  TelemetrySample out;
  out.set_id(r.id);
  out.set_node_id(r.node_id);
  out.set_deployment_id(r.deployment_id);
  *out.mutable_timestamp() = util::MillisToProto(r.timestamp_ms);
  out.set_latency_ms(r.latency_ms);
  out.set_throughput_gbps(r.throughput_gbps);
  out.set_error_rate(r.error_rate);
  return out;
}

Event ToProto(const db::model::EventRecord& r) {
  Event out;
  out.set_id(r.id);
  out.set_deployment_id(r.deployment_id.value_or(0));
  out.set_node_id(r.node_id.value_or(0));
  out.set_event_type(r.event_type);
  out.set_message(r.message);
  out.set_metadata(r.metadata);
  *out.mutable_created_at() = util::MillisToProto(r.created_at_ms);
  return out;
}

std::string CreationMetadata(uint32_t target_node_count) {
  google::protobuf::Struct metadata;
  (*metadata.mutable_fields())["target_node_count"].set_number_value(target_node_count);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize deployment metadata: " + std::string(status.message()));
  }
  return json;
}

} // namespace

OrchestratorService::OrchestratorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateDeploymentResponse OrchestratorService::CreateDeployment(const CreateDeploymentRequest& req) {
  return ObserveRpc("OrchestratorService.CreateDeployment", 0, [&] {
    if (req.name().empty() || req.name().size() > kMaxNameLength) {
      throw netorch::util::InvalidArgument(fmt::format("create deployment: name must be 1 to {} characters", kMaxNameLength));
    }
    if (req.target_node_count() < 1 || req.target_node_count() > kMaxNodesPerRequest) {
      throw netorch::util::InvalidArgument(
          fmt::format("create deployment: target_node_count must be between 1 and {}", kMaxNodesPerRequest));
    }

    const int64_t now_ms = util::ToUnixMillis(util::Now());
    auto          tx     = ctx_.repository->Begin();

    db::model::DeploymentRecord deployment;
    deployment.name              = req.name();
    deployment.description       = req.description();
    deployment.target_node_count = req.target_node_count();
    deployment.created_at_ms     = now_ms;
    deployment.updated_at_ms     = now_ms;
    db::ThrowIfError(ctx_.repository->InsertDeployment(*tx, deployment), "create deployment");

    for (uint32_t i = 1; i <= req.target_node_count(); ++i) {
      db::model::NodeRecord node;
      node.deployment_id       = deployment.id;
      node.node_id             = fmt::format("node-{:03d}", i);
      node.hostname            = fmt::format("switch-{}-{:03d}", deployment.id, i);
      node.state               = netorch::model::NodeState::kPending;
      node.created_at_ms       = now_ms;
      node.updated_at_ms       = now_ms;
      node.state_changed_at_ms = now_ms;
      db::ThrowIfError(ctx_.repository->InsertNode(*tx, node), "create node " + node.node_id);
    }

    db::model::EventRecord event;
    event.deployment_id = deployment.id;
    event.event_type    = db::model::kEventDeploymentCreated;
    event.message       = fmt::format("Deployment '{}' created with {} nodes", deployment.name, deployment.target_node_count);
    event.metadata      = CreationMetadata(deployment.target_node_count);
    event.created_at_ms = now_ms;
    db::ThrowIfError(ctx_.repository->InsertEvent(*tx, event), "record deployment event");

    tx->Commit();

    NETORCH_LOG_INFO("Deployment created", {IntField("deployment_id", deployment.id), StringField("name", deployment.name),
                                            IntField("nodes", deployment.target_node_count)});

    CreateDeploymentResponse resp;
    *resp.mutable_deployment() = ToProto(deployment);
    return resp;
  });
}

ListDeploymentsResponse OrchestratorService::ListDeployments(const ListDeploymentsRequest& req) {
  return ObserveRpc("OrchestratorService.ListDeployments", 0, [&] {
    db::Pagination page;
    page.limit  = ResolvePageSize(req.limit(), "list deployments");
    page.offset = req.offset();

    auto tx = ctx_.repository->Begin();

    ListDeploymentsResponse resp;
    for (const auto& record : ctx_.repository->ListDeployments(*tx, page)) {
      *resp.add_deployments() = ToProto(record);
    }
    resp.set_total(ctx_.repository->CountDeployments(*tx));
    return resp;
  });
}

GetDeploymentResponse OrchestratorService::GetDeployment(const GetDeploymentRequest& req) {
  return ObserveRpc("OrchestratorService.GetDeployment", req.deployment_id(), [&] {
    auto tx         = ctx_.repository->Begin();
    auto deployment = RequireDeployment(*ctx_.repository, *tx, req.deployment_id());

    GetDeploymentResponse resp;
    *resp.mutable_deployment() = ToProto(deployment);
    resp.set_current_node_count(ctx_.repository->CountNodes(*tx, deployment.id));
    return resp;
  });
}

DeleteDeploymentResponse OrchestratorService::DeleteDeployment(const DeleteDeploymentRequest& req) {
  return ObserveRpc("OrchestratorService.DeleteDeployment", req.deployment_id(), [&] {
    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->DeleteDeployment(*tx, req.deployment_id()), "delete deployment");
    tx->Commit();

    NETORCH_LOG_INFO("Deployment deleted", {IntField("deployment_id", req.deployment_id())});
    return DeleteDeploymentResponse{};
  });
}

ListNodesResponse OrchestratorService::ListNodes(const ListNodesRequest& req) {
  return ObserveRpc("OrchestratorService.ListNodes", req.deployment_id(), [&] {
    auto tx = ctx_.repository->Begin();
    RequireDeployment(*ctx_.repository, *tx, req.deployment_id());

    ListNodesResponse resp;
    for (const auto& node : ctx_.repository->ListNodesByDeployment(*tx, req.deployment_id())) {
      *resp.add_nodes() = ToProto(node);
    }
    resp.set_total(static_cast<uint64_t>(resp.nodes_size()));
    return resp;
  });
}

ListTelemetryResponse OrchestratorService::ListTelemetry(const ListTelemetryRequest& req) {
  return ObserveRpc("OrchestratorService.ListTelemetry", req.deployment_id(), [&] {
    db::TelemetryQuery query;
    query.deployment_id = req.deployment_id();
    query.limit         = ResolvePageSize(req.limit(), "list telemetry");
    if (req.node_id() != 0) query.node_id = req.node_id();
    if (req.has_start_time()) query.start_ms = util::ProtoToMillis(req.start_time());
    if (req.has_end_time()) query.end_ms = util::ProtoToMillis(req.end_time());
    if (query.start_ms && query.end_ms && *query.start_ms > *query.end_ms) {
      throw netorch::util::InvalidArgument("list telemetry: start_time is after end_time");
    }

    auto tx = ctx_.repository->Begin();
    RequireDeployment(*ctx_.repository, *tx, req.deployment_id());

    ListTelemetryResponse resp;
    for (const auto& sample : ctx_.repository->ListTelemetry(*tx, query)) {
      *resp.add_samples() = ToProto(sample);
    }
    resp.set_total(static_cast<uint64_t>(resp.samples_size()));
    return resp;
  });
}

ListEventsResponse OrchestratorService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("OrchestratorService.ListEvents", req.deployment_id(), [&] {
    db::EventQuery query;
    query.deployment_id = req.deployment_id();
    query.limit         = ResolvePageSize(req.limit(), "list events");
    if (req.node_id() != 0) query.node_id = req.node_id();

    auto tx = ctx_.repository->Begin();
    RequireDeployment(*ctx_.repository, *tx, req.deployment_id());

    ListEventsResponse resp;
    for (const auto& event : ctx_.repository->ListEvents(*tx, query)) {
      *resp.add_events() = ToProto(event);
    }
    resp.set_total(static_cast<uint64_t>(resp.events_size()));
    return resp;
  });
}

GetBottlenecksResponse OrchestratorService::GetBottlenecks(const GetBottlenecksRequest& req) {
  return ObserveRpc("OrchestratorService.GetBottlenecks", req.deployment_id(), [&] {
    uint32_t window = req.analysis_window_minutes() == 0 ? ctx_.default_window_minutes : req.analysis_window_minutes();
    if (window < 1 || window > kMaxWindowMinutes) {
      throw netorch::util::InvalidArgument(fmt::format("get bottlenecks: analysis_window_minutes must be between 1 and {}", kMaxWindowMinutes));
    }

    double threshold = ctx_.default_deviation_threshold;
    if (req.has_deviation_threshold()) {
      if (!(req.deviation_threshold() > 0.0)) {
        throw netorch::util::InvalidArgument("get bottlenecks: deviation_threshold must be positive");
      }
      threshold = req.deviation_threshold();
    }

    GetBottlenecksResponse resp;
    *resp.mutable_report() = ctx_.detector->Detect(req.deployment_id(), std::chrono::minutes(window), threshold, util::Now());
    return resp;
  });
}

HealthResponse OrchestratorService::Health(const HealthRequest&) {
  return ObserveRpc("OrchestratorService.Health", 0, [&] {
    HealthResponse resp;
    *resp.mutable_timestamp() = util::ToProto(util::Now());

    bool database_ok = false;
    try {
      database_ok = ctx_.repository->Ping();
      if (database_ok) {
        auto tx = ctx_.repository->Begin();
        resp.set_active_deployments(ctx_.repository->CountDeployments(*tx));
      }
    } catch (const std::exception& e) {
      database_ok = false;
      NETORCH_LOG_WARN("Health check: database unavailable", {StringField("error", e.what())});
    }

    resp.set_database(database_ok ? "connected" : "disconnected");
    resp.set_lifecycle_worker_alive(ctx_.lifecycle && ctx_.lifecycle->IsAlive());
    resp.set_telemetry_worker_alive(ctx_.telemetry && ctx_.telemetry->IsAlive());
    resp.set_status(database_ok && resp.lifecycle_worker_alive() && resp.telemetry_worker_alive() ? "healthy" : "degraded");
    return resp;
  });
}

} // namespace netorch::service
