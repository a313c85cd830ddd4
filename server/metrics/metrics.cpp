#include "server/metrics/metrics.h"

#include <algorithm>
#include <sstream>

namespace jdguard {

namespace {
constexpr std::array<RequestStage, 3> kStages{
    RequestStage::kRateLimit, RequestStage::kInputValidation,
    RequestStage::kContentFilter};
constexpr std::array<FailureKind, 3> kFailureKinds{
    FailureKind::kTimeout, FailureKind::kConnection, FailureKind::kFailure};
}  // namespace

const char* StageLabel(RequestStage stage) {
  switch (stage) {
    case RequestStage::kRateLimit:
      return "rate_limit";
    case RequestStage::kInputValidation:
      return "input_validation";
    case RequestStage::kContentFilter:
      return "content_filter";
  }
  return "unknown";
}

const char* FailureLabel(FailureKind kind) {
  switch (kind) {
    case FailureKind::kTimeout:
      return "timeout";
    case FailureKind::kConnection:
      return "connection";
    case FailureKind::kFailure:
      return "failure";
  }
  return "unknown";
}

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordAdmitted() {
  admitted_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRejected(RequestStage stage) {
  rejected_[static_cast<std::size_t>(stage)].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordOutputAccepted() {
  outputs_accepted_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordOutputRejected() {
  outputs_rejected_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordOutputTruncated() {
  outputs_truncated_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordGenerationFailure(FailureKind kind) {
  generation_failures_[static_cast<std::size_t>(kind)].fetch_add(
      1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordGenerationLatency(double ms) {
  generation_latency_.Record(ms);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  out << "# HELP jdguard_requests_admitted_total Requests that passed every pre-generation stage\n";
  out << "# TYPE jdguard_requests_admitted_total counter\n";
  out << "jdguard_requests_admitted_total " << admitted_.load() << "\n";

  out << "# HELP jdguard_requests_rejected_total Requests rejected before generation, by stage\n";
  out << "# TYPE jdguard_requests_rejected_total counter\n";
  for (auto stage : kStages) {
    out << "jdguard_requests_rejected_total{stage=\"" << StageLabel(stage) << "\"} "
        << rejected_[static_cast<std::size_t>(stage)].load() << "\n";
  }

  out << "# HELP jdguard_outputs_accepted_total Generated outputs that passed validation\n";
  out << "# TYPE jdguard_outputs_accepted_total counter\n";
  out << "jdguard_outputs_accepted_total " << outputs_accepted_.load() << "\n";

  out << "# HELP jdguard_outputs_rejected_total Generated outputs that failed validation\n";
  out << "# TYPE jdguard_outputs_rejected_total counter\n";
  out << "jdguard_outputs_rejected_total " << outputs_rejected_.load() << "\n";

  out << "# HELP jdguard_outputs_truncated_total Generated outputs cut to the maximum length\n";
  out << "# TYPE jdguard_outputs_truncated_total counter\n";
  out << "jdguard_outputs_truncated_total " << outputs_truncated_.load() << "\n";

  out << "# HELP jdguard_generation_failures_total Backend calls that failed, by kind\n";
  out << "# TYPE jdguard_generation_failures_total counter\n";
  for (auto kind : kFailureKinds) {
    out << "jdguard_generation_failures_total{kind=\"" << FailureLabel(kind) << "\"} "
        << generation_failures_[static_cast<std::size_t>(kind)].load() << "\n";
  }

  out << "# HELP jdguard_generation_latency_ms Backend call latency in milliseconds\n";
  out << "# TYPE jdguard_generation_latency_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "jdguard_generation_latency_ms_bucket{le=\""
        << LatencyHistogram::kBuckets[i] << "\"} "
        << generation_latency_.counts[i].load() << "\n";
  }
  out << "jdguard_generation_latency_ms_bucket{le=\"+Inf\"} "
      << generation_latency_.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << "jdguard_generation_latency_ms_sum " << generation_latency_.sum_ms.load() << "\n";
  out << "jdguard_generation_latency_ms_count " << generation_latency_.total.load() << "\n";

  return out.str();
}

}  // namespace jdguard
