#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace netorch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;
namespace cfg         = netorch::runtime::config;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool worker_metrics_enabled{true};
  bool route_labels_enabled{true};
};

MetricsOptions g_metrics_options;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      cycle_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> telemetry_samples;
};

bool InitializeMetrics(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == cfg::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.request_metrics_enabled = !metric_config.disable_request_metrics();
  g_metrics_options.worker_metrics_enabled  = !metric_config.disable_worker_metrics();
  g_metrics_options.route_labels_enabled    = !metric_config.disable_route_labels();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("netorch", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("netorch.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("netorch.request.latency_ms", "End-to-end request latency", "ms");
  impl_->cycle_duration_ms  = impl_->meter->CreateDoubleHistogram("netorch.worker.cycle_ms", "Periodic worker cycle duration", "ms");
  impl_->transitions        = impl_->meter->CreateUInt64Counter("netorch.node.transitions", "Applied node state transitions", "1");
  impl_->telemetry_samples  = impl_->meter->CreateUInt64Counter("netorch.telemetry.samples", "Persisted telemetry samples", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_->request_count || !g_metrics_options.request_metrics_enabled) return;

  if (g_metrics_options.route_labels_enabled) {
    const std::string                          route_name(route);
    const std::initializer_list<AttributePair> attributes = {{"route", route_name}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) return;

  if (g_metrics_options.route_labels_enabled) {
    const std::string                          route_name(route);
    const std::initializer_list<AttributePair> attributes = {{"route", route_name}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::ObserveCycleDurationMs(std::string_view worker, double duration_ms) {
  if (!impl_->cycle_duration_ms || !g_metrics_options.worker_metrics_enabled) return;

  const std::string                          worker_name(worker);
  const std::initializer_list<AttributePair> attributes = {{"worker", worker_name}};
  RecordWithAttributes(impl_->cycle_duration_ms, duration_ms, attributes);
}

void Metrics::RecordTransition(std::string_view from_state, std::string_view to_state) {
  if (!impl_->transitions || !g_metrics_options.worker_metrics_enabled) return;

  const std::string                          from(from_state);
  const std::string                          to(to_state);
  const std::initializer_list<AttributePair> attributes = {{"from", from}, {"to", to}};
  AddWithAttributes(impl_->transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTelemetrySamples(std::uint64_t count) {
  if (!impl_->telemetry_samples || !g_metrics_options.worker_metrics_enabled) return;

  AddWithAttributes(impl_->telemetry_samples, count, std::initializer_list<AttributePair>{});
}

} // namespace netorch::observability

#endif
