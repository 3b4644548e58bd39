#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/time_util.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "netorch/v1.hpp"
#include "netorch/v1/orchestrator_service.grpc.pb.h"

using namespace netorch::v1;
using google::protobuf::util::TimeUtil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  netorchctl <addr> create <name> <target_node_count> [description]\n"
            << "  netorchctl <addr> list [offset] [limit]\n"
            << "  netorchctl <addr> get <deployment_id>\n"
            << "  netorchctl <addr> delete <deployment_id>\n"
            << "  netorchctl <addr> nodes <deployment_id>\n"
            << "  netorchctl <addr> telemetry <deployment_id> [node_id] [limit]\n"
            << "  netorchctl <addr> events <deployment_id> [node_id] [limit]\n"
            << "  netorchctl <addr> bottlenecks <deployment_id> [window_minutes] [threshold]\n"
            << "  netorchctl <addr> health\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintDeployment(const Deployment& d) {
  std::cout << "id=" << d.id() << " name=" << d.name() << " target_node_count=" << d.target_node_count()
            << " created_at=" << TimeUtil::ToString(d.created_at()) << "\n";
}

static void PrintNode(const Node& n) {
  std::cout << "id=" << n.id() << " node_id=" << n.node_id() << " hostname=" << n.hostname()
            << " state=" << NodeState_Name(n.state()) << " ip=" << (n.ip_address().empty() ? "-" : n.ip_address()) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = OrchestratorService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      CreateDeploymentRequest req;
      req.set_name(argv[3]);
      req.set_target_node_count(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) req.set_description(argv[5]);

      CreateDeploymentResponse resp;
      auto status = stub->CreateDeployment(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintDeployment(resp.deployment());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      ListDeploymentsRequest req;
      if (argc >= 4) req.set_offset(static_cast<uint32_t>(std::stoul(argv[3])));
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

      ListDeploymentsResponse resp;
      auto status = stub->ListDeployments(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& d : resp.deployments()) PrintDeployment(d);
      std::cout << "total=" << resp.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      GetDeploymentRequest req;
      req.set_deployment_id(std::stoll(argv[3]));

      GetDeploymentResponse resp;
      auto status = stub->GetDeployment(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintDeployment(resp.deployment());
      std::cout << "current_node_count=" << resp.current_node_count() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      DeleteDeploymentRequest req;
      req.set_deployment_id(std::stoll(argv[3]));

      DeleteDeploymentResponse resp;
      auto status = stub->DeleteDeployment(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "deleted\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "nodes") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      ListNodesRequest req;
      req.set_deployment_id(std::stoll(argv[3]));

      ListNodesResponse resp;
      auto status = stub->ListNodes(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& n : resp.nodes()) PrintNode(n);
      std::cout << "total=" << resp.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "telemetry") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      ListTelemetryRequest req;
      req.set_deployment_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_node_id(std::stoll(argv[4]));
      if (argc >= 6) req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

      ListTelemetryResponse resp;
      auto status = stub->ListTelemetry(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& s : resp.samples()) {
        std::cout << TimeUtil::ToString(s.timestamp()) << " node=" << s.node_id() << " latency_ms=" << s.latency_ms()
                  << " throughput_gbps=" << s.throughput_gbps() << " error_rate=" << s.error_rate() << "\n";
      }
      std::cout << "total=" << resp.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "events") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      ListEventsRequest req;
      req.set_deployment_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_node_id(std::stoll(argv[4]));
      if (argc >= 6) req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

      ListEventsResponse resp;
      auto status = stub->ListEvents(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& e : resp.events()) {
        std::cout << TimeUtil::ToString(e.created_at()) << " [" << e.event_type() << "] " << e.message() << "\n";
      }
      std::cout << "total=" << resp.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "bottlenecks") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      GetBottlenecksRequest req;
      req.set_deployment_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_analysis_window_minutes(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) req.set_deviation_threshold(std::stod(argv[5]));

      GetBottlenecksResponse resp;
      auto status = stub->GetBottlenecks(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& report = resp.report();
      std::cout << "window_minutes=" << report.analysis_window_minutes() << " threshold=" << report.deviation_threshold()
                << " total=" << report.total_bottlenecks() << "\n";
      for (const auto& b : report.bottlenecks()) {
        std::cout << b.node_identifier() << " score=" << b.deviation_score() << " latency_ms=" << b.latency_ms()
                  << " throughput_gbps=" << b.throughput_gbps() << " error_rate=" << b.error_rate() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "health") {
      HealthRequest  req;
      HealthResponse resp;
      auto status = stub->Health(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "status=" << resp.status() << " database=" << resp.database()
                << " active_deployments=" << resp.active_deployments()
                << " lifecycle_worker=" << (resp.lifecycle_worker_alive() ? "alive" : "stopped")
                << " telemetry_worker=" << (resp.telemetry_worker_alive() ? "alive" : "stopped") << "\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoll / std::stoul on bad input
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
