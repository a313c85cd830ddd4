#include <catch2/catch_test_macros.hpp>

#include "runtime/backends/generation_backend.h"
#include "server/config/guardrail_config.h"
#include "server/generation/jd_service.h"
#include "server/logging/audit_logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/guardrails_manager.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

constexpr char kRoleDetails[] = "Warehouse shift lead, forklift certified";

// Returns a canned reply or throws the configured error.
class FakeBackend : public jdguard::GenerationBackend {
public:
  std::string reply;
  std::optional<jdguard::GenerationError::Kind> failure;
  std::string last_prompt;
  int calls{0};

  std::string Generate(const std::string &role_details) override {
    ++calls;
    last_prompt = role_details;
    if (failure) {
      throw jdguard::GenerationError(*failure, "fake failure");
    }
    return reply;
  }
  std::string Name() const override { return "fake"; }
};

std::string ValidDescription() {
  return "Job Title: Warehouse Shift Lead\n"
         "Job Summary: Lead the night shift in a regional fulfilment centre.\n"
         "Responsibilities: Schedule pickers, run safety briefings.\n"
         "Skills: Forklift certification, team leadership.\n";
}

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Service generates from sanitized input", "[service]") {
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults());
  FakeBackend backend;
  backend.reply = ValidDescription();
  jdguard::JobDescriptionService service(guardrails, backend);

  auto result = service.Generate("10.0.0.1", "  <b>Warehouse</b> shift lead,   forklift certified ");
  REQUIRE(result.outcome.accepted);
  REQUIRE(result.HttpStatus() == 200);
  REQUIRE(result.generation_attempted);
  REQUIRE(backend.last_prompt == "Warehouse shift lead, forklift certified");
  REQUIRE(result.outcome.metrics->job_title == "Warehouse Shift Lead");
}

TEST_CASE("Service does not call the backend for rejected input", "[service]") {
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults());
  FakeBackend backend;
  jdguard::JobDescriptionService service(guardrails, backend);

  auto result = service.Generate("10.0.0.1", "hi");
  REQUIRE(!result.outcome.accepted);
  REQUIRE(result.HttpStatus() == 400);
  REQUIRE(!result.generation_attempted);
  REQUIRE(backend.calls == 0);
}

TEST_CASE("Service maps backend failures", "[service]") {
  jdguard::MetricsRegistry metrics;
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults(),
                                        nullptr, &metrics);
  FakeBackend backend;
  jdguard::JobDescriptionService service(guardrails, backend, &metrics);

  backend.failure = jdguard::GenerationError::Kind::kTimeout;
  auto timed_out = service.Generate("10.0.0.1", kRoleDetails);
  REQUIRE(timed_out.outcome.kind == jdguard::RejectionKind::kGenerationFailure);
  REQUIRE(timed_out.outcome.detail == jdguard::RejectionDetail::kBackendTimeout);
  REQUIRE(timed_out.outcome.reason == "Generation timed out");
  REQUIRE(timed_out.HttpStatus() == 504);

  backend.failure = jdguard::GenerationError::Kind::kConnection;
  auto down = service.Generate("10.0.0.2", kRoleDetails);
  REQUIRE(down.outcome.detail == jdguard::RejectionDetail::kBackendConnection);
  REQUIRE(down.HttpStatus() == 500);

  backend.failure = jdguard::GenerationError::Kind::kFailure;
  auto failed = service.Generate("10.0.0.3", kRoleDetails);
  REQUIRE(failed.outcome.reason == "Generation failed");
  REQUIRE(failed.generated.empty());

  auto out = metrics.RenderPrometheus();
  REQUIRE(Contains(out, "jdguard_generation_failures_total{kind=\"timeout\"} 1\n"));
  REQUIRE(Contains(out, "jdguard_generation_failures_total{kind=\"connection\"} 1\n"));
  REQUIRE(Contains(out, "jdguard_generation_failures_total{kind=\"failure\"} 1\n"));
  REQUIRE(Contains(out, "jdguard_generation_latency_ms_count 3\n"));
}

TEST_CASE("Service rejects malformed generated output", "[service]") {
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults());
  FakeBackend backend;
  backend.reply = std::string(300, 'x');
  jdguard::JobDescriptionService service(guardrails, backend);

  auto result = service.Generate("10.0.0.1", kRoleDetails);
  REQUIRE(result.outcome.kind == jdguard::RejectionKind::kOutputFormatInvalid);
  REQUIRE(result.HttpStatus() == 500);
  REQUIRE(result.generated == backend.reply);
}

TEST_CASE("Service lets unexpected backend exceptions propagate", "[service]") {
  class ThrowingBackend : public jdguard::GenerationBackend {
  public:
    std::string Generate(const std::string &) override {
      throw std::logic_error("bug");
    }
    std::string Name() const override { return "throwing"; }
  };
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults());
  ThrowingBackend backend;
  jdguard::JobDescriptionService service(guardrails, backend);
  REQUIRE_THROWS_AS(service.Generate("10.0.0.1", kRoleDetails), std::logic_error);
}

TEST_CASE("Service audits generation failures", "[service]") {
  auto tmp_path = std::filesystem::temp_directory_path() / "jdguard_service_audit.jsonl";
  std::filesystem::remove(tmp_path);
  {
    jdguard::AuditLogger audit(tmp_path.string());
    jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults(), &audit);
    FakeBackend backend;
    backend.failure = jdguard::GenerationError::Kind::kTimeout;
    jdguard::JobDescriptionService service(guardrails, backend);
    service.Generate("10.0.0.1", kRoleDetails);
  }
  std::ifstream in(tmp_path);
  std::string line;
  REQUIRE(std::getline(in, line));
  REQUIRE(json::parse(line)["stage"] == "pipeline");
  REQUIRE(std::getline(in, line));
  auto failure = json::parse(line);
  REQUIRE(failure["stage"] == "generation");
  REQUIRE(failure["decision"] == "rejected");
  REQUIRE(failure["reason"] == "Generation timed out");
  REQUIRE(failure["identity"] == "10.0.0.1");
  std::filesystem::remove(tmp_path);
}
