#include "bottleneck_detector.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "statistics.hpp"

namespace netorch::analytics {

namespace {

constexpr double kLatencyWeight    = 0.4;
constexpr double kThroughputWeight = 0.4;
constexpr double kErrorRateWeight  = 0.2;

struct NodeSamples {
  std::vector<double> latency;
  std::vector<double> throughput;
  std::vector<double> error_rate;
  int64_t             latest_ms = 0;
};

} // namespace

BottleneckDetector::BottleneckDetector(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

netorch::v1::BottleneckReport BottleneckDetector::Detect(int64_t deployment_id, std::chrono::minutes window, double deviation_threshold,
                                                         util::TimePoint now) const {
  observability::SpanScope span("BottleneckDetector.Detect");
  span.SetAttribute("deployment.id", deployment_id);

  netorch::v1::BottleneckReport report;
  report.set_deployment_id(deployment_id);
  *report.mutable_detected_at() = util::ToProto(now);
  report.set_analysis_window_minutes(static_cast<uint32_t>(window.count()));
  report.set_deviation_threshold(deviation_threshold);

  std::vector<db::model::TelemetrySampleRecord> samples;
  std::map<int64_t, std::string>                identifiers;
  {
    auto tx = repository_->Begin();
    if (!repository_->GetDeployment(*tx, deployment_id)) {
      throw netorch::util::NotFound("deployment " + std::to_string(deployment_id) + " not found");
    }

    db::TelemetryQuery query;
    query.deployment_id = deployment_id;
    query.start_ms      = util::ToUnixMillis(now - window);
    samples             = repository_->ListTelemetry(*tx, query);

    for (const auto& node : repository_->ListNodesByDeployment(*tx, deployment_id)) {
      identifiers[node.id] = node.node_id;
    }
  }

  if (samples.empty()) {
    report.set_total_bottlenecks(0);
    return report;
  }

  std::vector<double>            all_latency, all_throughput, all_error;
  std::map<int64_t, NodeSamples> per_node;
  for (const auto& s : samples) {
    all_latency.push_back(s.latency_ms);
    all_throughput.push_back(s.throughput_gbps);
    all_error.push_back(s.error_rate);

    auto& node = per_node[s.node_id];
    node.latency.push_back(s.latency_ms);
    node.throughput.push_back(s.throughput_gbps);
    node.error_rate.push_back(s.error_rate);
    node.latest_ms = std::max(node.latest_ms, s.timestamp_ms);
  }

  const double latency_mean    = Mean(all_latency);
  const double latency_sd      = SampleStdDev(all_latency);
  const double throughput_mean = Mean(all_throughput);
  const double throughput_sd   = SampleStdDev(all_throughput);
  const double error_mean      = Mean(all_error);
  const double error_sd        = SampleStdDev(all_error);

  std::vector<netorch::v1::BottleneckNode> flagged;
  for (const auto& [node_id, node] : per_node) {
    const double latency    = Mean(node.latency);
    const double throughput = Mean(node.throughput);
    const double error_rate = Mean(node.error_rate);

    const double latency_dev    = ZScore(latency, latency_mean, latency_sd);
    const double throughput_dev = ZScore(throughput_mean, throughput, throughput_sd);
    const double error_dev      = ZScore(error_rate, error_mean, error_sd);

    if (latency_dev < deviation_threshold && throughput_dev < deviation_threshold && error_dev < deviation_threshold) continue;

    netorch::v1::BottleneckNode entry;
    entry.set_node_id(node_id);
    auto it = identifiers.find(node_id);
    entry.set_node_identifier(it != identifiers.end() ? it->second : std::to_string(node_id));
    entry.set_deployment_id(deployment_id);
    entry.set_latency_ms(latency);
    entry.set_throughput_gbps(throughput);
    entry.set_error_rate(error_rate);
    entry.set_deviation_score(kLatencyWeight * std::max(0.0, latency_dev) + kThroughputWeight * std::max(0.0, throughput_dev) +
                              kErrorRateWeight * std::max(0.0, error_dev));
    entry.set_latency_deviation(latency_dev);
    entry.set_throughput_deviation(throughput_dev);
    entry.set_error_rate_deviation(error_dev);
    *entry.mutable_timestamp() = util::MillisToProto(node.latest_ms);
    flagged.push_back(std::move(entry));
  }

  // ties keep node id order
  std::stable_sort(flagged.begin(), flagged.end(),
                   [](const auto& a, const auto& b) { return a.deviation_score() > b.deviation_score(); });

  for (auto& entry : flagged) *report.add_bottlenecks() = std::move(entry);
  report.set_total_bottlenecks(static_cast<uint32_t>(report.bottlenecks_size()));
  span.SetAttribute("bottlenecks", static_cast<int64_t>(report.total_bottlenecks()));
  return report;
}

} // namespace netorch::analytics
