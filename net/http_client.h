#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace jdguard {

struct HttpResponse {
  int status{0};
  std::string body;
};

// Transport failure. kConnect covers resolution, refused connections and a
// peer reset, kTimeout a connect, send or receive that exceeded the client
// timeout, kProtocol anything else (TLS, malformed URL, garbled response).
class HttpError : public std::runtime_error {
public:
  enum class Kind { kConnect, kTimeout, kProtocol };

  HttpError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

class HttpClient {
public:
  explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Throws HttpError. A non-2xx status is returned, not thrown. Plain HTTP
  // sends never raise SIGPIPE; OpenSSL writes do, so TLS hosts ignore it.
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;

  std::chrono::seconds Timeout() const { return timeout_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  std::chrono::seconds timeout_;
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace jdguard
