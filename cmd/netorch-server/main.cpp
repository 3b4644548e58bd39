#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using netorch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: netorch-server <config.yaml> OR netorch-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = netorch::config::ConfigLoader::LoadFromYaml(config_path);

    netorch::observability::InitializeTracing(config);
    netorch::observability::InitializeMetrics(config);
    netorch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = netorch::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<netorch::grpc::OrchestratorServer>(app.orchestrator));

    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // Workers run before the first request is accepted.
    app.StartWorkers();
    server.Start();
    NETORCH_LOG_INFO("Orchestrator started", {netorch::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    NETORCH_LOG_INFO("Shutting down orchestrator");

    server.Stop();
    app.StopWorkers();

    netorch::observability::ShutdownLogging();
    netorch::observability::ShutdownMetrics();
    netorch::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    NETORCH_LOG_ERROR("Fatal error", {netorch::observability::StringField("error", e.what())});
    netorch::observability::ShutdownLogging();
    netorch::observability::ShutdownMetrics();
    netorch::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
