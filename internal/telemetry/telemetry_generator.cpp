#include "telemetry_generator.hpp"

#include <vector>

#include "internal/db/api/result_check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "waveform.hpp"

namespace netorch::telemetry {

using netorch::observability::IntField;
using netorch::observability::StringField;

TelemetryGenerator::TelemetryGenerator(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds interval,
                                       std::chrono::milliseconds error_backoff)
    : repository_(std::move(repository)),
      task_("telemetry", interval, error_backoff, [this] { RunCycle(util::Now()); }) {
}

CollectionStats TelemetryGenerator::RunCycle(util::TimePoint now) {
  observability::SpanScope span("TelemetryGenerator.RunCycle");
  const int64_t            now_ms = util::ToUnixMillis(now);

  std::vector<db::model::NodeRecord> running;
  {
    auto tx = repository_->Begin();
    running = repository_->ListNodesByState(*tx, {netorch::model::NodeState::kRunning});
  }

  CollectionStats stats;
  stats.nodes = running.size();
  for (const auto& node : running) {
    try {
      const auto values = Synthesize(node.id, now);

      db::model::TelemetrySampleRecord sample;
      sample.node_id         = node.id;
      sample.deployment_id   = node.deployment_id;
      sample.timestamp_ms    = now_ms;
      sample.latency_ms      = values.latency_ms;
      sample.throughput_gbps = values.throughput_gbps;
      sample.error_rate      = values.error_rate;

      auto tx = repository_->Begin();
      db::ThrowIfError(repository_->InsertTelemetrySample(*tx, sample), "insert telemetry for " + node.node_id);
      tx->Commit();
      ++stats.written;
    } catch (const std::exception& e) {
      ++stats.failed;
      NETORCH_LOG_ERROR("Telemetry sample failed", {StringField("node", node.node_id), IntField("deployment_id", node.deployment_id),
                                                    StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().RecordTelemetrySamples(stats.written);
  span.SetAttribute("samples.written", static_cast<int64_t>(stats.written));
  return stats;
}

void TelemetryGenerator::Start() {
  task_.Start();
}

void TelemetryGenerator::Stop() {
  task_.Stop();
}

bool TelemetryGenerator::IsAlive() const {
  return task_.IsRunning();
}

} // namespace netorch::telemetry
