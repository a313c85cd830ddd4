#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace jdguard {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 100, 500, 1000, 5000, 10000, 30000, 60000,
  // 120000, +Inf. Generation calls run for seconds, not milliseconds.
  static constexpr std::array<double, 8> kBuckets{
      100.0, 500.0, 1000.0, 5000.0, 10000.0, 30000.0, 60000.0, 120000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Pipeline stages that can reject a request before generation.
enum class RequestStage { kRateLimit, kInputValidation, kContentFilter };

// Backend failure classes, mirroring GenerationError::Kind.
enum class FailureKind { kTimeout, kConnection, kFailure };

class MetricsRegistry {
public:
  void RecordAdmitted();
  void RecordRejected(RequestStage stage);

  void RecordOutputAccepted();
  void RecordOutputRejected();
  void RecordOutputTruncated();

  void RecordGenerationFailure(FailureKind kind);
  // Wall-clock duration of one backend call, successful or not.
  void RecordGenerationLatency(double ms);

  std::string RenderPrometheus() const;

private:
  std::atomic<uint64_t> admitted_{0};
  std::array<std::atomic<uint64_t>, 3> rejected_{};
  std::atomic<uint64_t> outputs_accepted_{0};
  std::atomic<uint64_t> outputs_rejected_{0};
  std::atomic<uint64_t> outputs_truncated_{0};
  std::array<std::atomic<uint64_t>, 3> generation_failures_{};

  LatencyHistogram generation_latency_;
};

const char *StageLabel(RequestStage stage);
const char *FailureLabel(FailureKind kind);

} // namespace jdguard
