#include <catch2/catch_test_macros.hpp>

#include "runtime/backends/ollama_backend.h"
#include "server/config/guardrail_config.h"
#include "server/generation/jd_service.h"
#include "server/policy/guardrails_manager.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace {

// One-shot HTTP listener on 127.0.0.1. Accepts a single connection, captures
// the request, and answers with `reply` (or nothing when `reply` is empty,
// holding the connection until the client gives up).
class OneShotServer {
public:
  explicit OneShotServer(std::string reply) : reply_(std::move(reply)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    ::listen(listen_fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this]() { Serve(); });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(listen_fd_);
  }

  std::string BaseUrl() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }
  const std::string &Request() const { return request_; }

private:
  void Serve() {
    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) {
      return;
    }
    char buffer[4096];
    while (true) {
      auto header_end = request_.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        auto cl = request_.find("Content-Length: ");
        std::size_t body_len = cl == std::string::npos
                                   ? 0
                                   : std::stoul(request_.substr(cl + 16));
        if (request_.size() >= header_end + 4 + body_len) {
          break;
        }
      }
      ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      request_.append(buffer, static_cast<std::size_t>(n));
    }
    if (!reply_.empty()) {
      ::send(fd, reply_.data(), reply_.size(), 0);
    } else {
      // Wait for the client to time out and hang up.
      while (::recv(fd, buffer, sizeof(buffer), 0) > 0) {
      }
    }
    ::close(fd);
  }

  std::string reply_;
  std::string request_;
  int listen_fd_{-1};
  int port_{0};
  std::thread thread_;
};

std::string HttpReply(int status, const std::string &body) {
  return "HTTP/1.1 " + std::to_string(status) +
         " X\r\nContent-Type: application/json\r\nContent-Length: " +
         std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

jdguard::OllamaConfig ConfigFor(const std::string &base_url) {
  jdguard::OllamaConfig config;
  config.base_url = base_url;
  config.model = "mistral";
  config.timeout_seconds = 1;
  return config;
}

} // namespace

TEST_CASE("OllamaBackend payload carries model and options", "[ollama]") {
  jdguard::OllamaConfig config;
  config.model = "llama3";
  config.temperature = 0.5;
  config.max_tokens = 800;
  jdguard::OllamaBackend backend(config);

  auto payload = json::parse(backend.BuildPayload("Barista, weekend shifts"));
  REQUIRE(payload["model"] == "llama3");
  REQUIRE(payload["stream"] == false);
  REQUIRE(payload["options"]["temperature"] == 0.5);
  REQUIRE(payload["options"]["num_predict"] == 800);
  REQUIRE(payload["prompt"].get<std::string>().find("Barista, weekend shifts") !=
          std::string::npos);
  REQUIRE(backend.Name() == "ollama:llama3");
}

TEST_CASE("OllamaBackend ParseReply extracts response text", "[ollama]") {
  jdguard::HttpResponse reply{200, R"({"response":"Job Title: Barista","done":true})"};
  REQUIRE(jdguard::OllamaBackend::ParseReply(reply) == "Job Title: Barista");
}

TEST_CASE("OllamaBackend ParseReply rejects bad replies", "[ollama]") {
  auto kind_of = [](const jdguard::HttpResponse &reply) {
    try {
      jdguard::OllamaBackend::ParseReply(reply);
    } catch (const jdguard::GenerationError &e) {
      return e.kind();
    }
    FAIL("ParseReply did not throw");
    return jdguard::GenerationError::Kind::kTimeout;
  };
  REQUIRE(kind_of({500, R"({"response":"x"})"}) ==
          jdguard::GenerationError::Kind::kFailure);
  REQUIRE(kind_of({200, "not json"}) == jdguard::GenerationError::Kind::kFailure);
  REQUIRE(kind_of({200, R"({"error":"model not found"})"}) ==
          jdguard::GenerationError::Kind::kFailure);
  REQUIRE(kind_of({200, R"(["response"])"}) ==
          jdguard::GenerationError::Kind::kFailure);
}

TEST_CASE("OllamaBackend posts to /api/generate", "[ollama]") {
  OneShotServer server(HttpReply(200, R"({"response":"Job Title: Baker"})"));
  jdguard::OllamaBackend backend(ConfigFor(server.BaseUrl()));

  REQUIRE(backend.Generate("Bakery role, early mornings") == "Job Title: Baker");
  REQUIRE(server.Request().rfind("POST /api/generate HTTP/1.1\r\n", 0) == 0);
}

TEST_CASE("OllamaBackend maps HTTP errors to failures", "[ollama]") {
  OneShotServer server(HttpReply(404, R"({"error":"model 'mistral' not found"})"));
  jdguard::OllamaBackend backend(ConfigFor(server.BaseUrl()));
  try {
    backend.Generate("Bakery role, early mornings");
    FAIL("expected GenerationError");
  } catch (const jdguard::GenerationError &e) {
    REQUIRE(e.kind() == jdguard::GenerationError::Kind::kFailure);
  }
}

TEST_CASE("OllamaBackend reports a silent backend as a timeout", "[ollama]") {
  OneShotServer server("");
  jdguard::OllamaBackend backend(ConfigFor(server.BaseUrl()));
  try {
    backend.Generate("Bakery role, early mornings");
    FAIL("expected GenerationError");
  } catch (const jdguard::GenerationError &e) {
    REQUIRE(e.kind() == jdguard::GenerationError::Kind::kTimeout);
  }
}

TEST_CASE("OllamaBackend reports a refused connection", "[ollama]") {
  // Bind and release a port so nothing is listening on it.
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  int port = ntohs(addr.sin_port);
  ::close(fd);

  jdguard::OllamaBackend backend(
      ConfigFor("http://127.0.0.1:" + std::to_string(port)));
  try {
    backend.Generate("Bakery role, early mornings");
    FAIL("expected GenerationError");
  } catch (const jdguard::GenerationError &e) {
    REQUIRE(e.kind() == jdguard::GenerationError::Kind::kConnection);
  }
}

TEST_CASE("OllamaBackend replaces invalid UTF-8 in the payload", "[ollama]") {
  jdguard::OllamaBackend backend(jdguard::OllamaConfig{});
  std::string payload;
  REQUIRE_NOTHROW(payload = backend.BuildPayload("Senior chef \xC3\x28 kitchen lead"));
  auto prompt = json::parse(payload)["prompt"].get<std::string>();
  REQUIRE(prompt.find("\xEF\xBF\xBD") != std::string::npos);
  REQUIRE(prompt.find("kitchen lead") != std::string::npos);
}

TEST_CASE("Invalid UTF-8 role details reach the backend", "[ollama]") {
  std::string description =
      "Job Title: Head Chef\n"
      "Job Summary: Run the kitchen of a busy city-centre bistro.\n"
      "Responsibilities: Plan menus, train cooks, manage suppliers.\n"
      "Skills: French cuisine, stock control, leadership.\n";
  OneShotServer server(HttpReply(200, json{{"response", description}}.dump()));
  jdguard::OllamaBackend backend(ConfigFor(server.BaseUrl()));
  jdguard::GuardrailsManager guardrails(jdguard::GuardrailConfig::Defaults());
  jdguard::JobDescriptionService service(guardrails, backend);

  auto result = service.Generate("10.0.0.1", "Senior chef \xC3\x28 kitchen lead");
  REQUIRE(result.outcome.accepted);
  REQUIRE(result.outcome.metrics->job_title == "Head Chef");
}

TEST_CASE("OllamaBackend reports a reset connection", "[ollama]") {
  int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  ::listen(listen_fd, 1);
  socklen_t len = sizeof(addr);
  ::getsockname(listen_fd, reinterpret_cast<sockaddr *>(&addr), &len);
  int port = ntohs(addr.sin_port);

  // Accept, then close with unread data and a zero linger so the peer sees RST.
  std::thread server([listen_fd]() {
    int fd = ::accept(listen_fd, nullptr, nullptr);
    if (fd < 0) {
      return;
    }
    linger reset{1, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_LINGER, &reset, sizeof(reset));
    ::close(fd);
  });

  jdguard::OllamaBackend backend(
      ConfigFor("http://127.0.0.1:" + std::to_string(port)));
  // Larger than the loopback socket buffers, so the send is still running
  // when the reset arrives.
  std::string role_details(32 * 1024 * 1024, 'a');
  bool reported = false;
  auto kind = jdguard::GenerationError::Kind::kFailure;
  try {
    backend.Generate(role_details);
  } catch (const jdguard::GenerationError &e) {
    reported = true;
    kind = e.kind();
  }
  server.join();
  ::close(listen_fd);
  REQUIRE(reported);
  REQUIRE(kind == jdguard::GenerationError::Kind::kConnection);
}
