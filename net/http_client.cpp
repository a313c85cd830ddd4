#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jdguard {
namespace {
struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw HttpError(HttpError::Kind::kProtocol, "invalid URL port: " + url);
    }
  }
  if (parsed.host.empty()) {
    throw HttpError(HttpError::Kind::kProtocol, "invalid URL host: " + url);
  }
  return parsed;
}

bool IsTimeoutErrno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT ||
         err == EINPROGRESS;
}

bool IsResetErrno(int err) {
  return err == EPIPE || err == ECONNRESET || err == ECONNABORTED;
}

// Socket timeouts are set before connect so that connect, send and every
// recv are each bounded by `timeout`.
int CreateSocket(const ParsedUrl &parsed, std::chrono::seconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw HttpError(HttpError::Kind::kConnect,
                    "failed to resolve host " + parsed.host);
  }
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count());
  tv.tv_usec = 0;
  int sock = -1;
  int last_errno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    last_errno = errno;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1) {
    if (IsTimeoutErrno(last_errno)) {
      throw HttpError(HttpError::Kind::kTimeout,
                      "timed out connecting to " + parsed.host + ":" +
                          std::to_string(parsed.port));
    }
    throw HttpError(HttpError::Kind::kConnect,
                    "failed to connect to " + parsed.host + ":" +
                        std::to_string(parsed.port));
  }
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  request << "Content-Type: application/json\r\n";
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string DecodeChunked(const std::string &raw) {
  std::string decoded;
  std::size_t pos = 0;
  while (pos < raw.size()) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      throw HttpError(HttpError::Kind::kProtocol, "truncated chunked body");
    }
    std::size_t size = 0;
    try {
      size = std::stoul(raw.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception &) {
      throw HttpError(HttpError::Kind::kProtocol, "invalid chunk size");
    }
    if (size == 0) {
      break;
    }
    pos = line_end + 2;
    if (pos + size > raw.size()) {
      throw HttpError(HttpError::Kind::kProtocol, "truncated chunk");
    }
    decoded.append(raw, pos, size);
    pos += size + 2;
  }
  return decoded;
}

HttpResponse ParseResponse(const std::string &response) {
  HttpResponse http_response;
  auto header_end = response.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    throw HttpError(HttpError::Kind::kProtocol, "malformed HTTP response");
  }
  std::string header = response.substr(0, header_end);
  std::string body_str = response.substr(header_end + 4);
  auto status_pos = header.find(' ');
  if (status_pos != std::string::npos) {
    try {
      http_response.status = std::stoi(header.substr(status_pos + 1));
    } catch (const std::exception &) {
      http_response.status = 0;
    }
  }
  if (ToLower(header).find("transfer-encoding: chunked") != std::string::npos) {
    body_str = DecodeChunked(body_str);
  }
  http_response.body = body_str;
  return http_response;
}
} // namespace

HttpClient::HttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  int sock = CreateSocket(parsed, timeout_);
  auto payload = BuildRequest(parsed, method, body, headers);
  std::string response;
  SSL *ssl = nullptr;

  auto close_all = [&]() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
      ssl = nullptr;
    }
    if (sock != -1) {
      ::close(sock);
      sock = -1;
    }
  };
  auto fail = [&](HttpError::Kind kind, const std::string &message) {
    close_all();
    throw HttpError(kind, message);
  };
  auto io_failure_kind = [](int err) {
    if (IsTimeoutErrno(err)) {
      return HttpError::Kind::kTimeout;
    }
    return IsResetErrno(err) ? HttpError::Kind::kConnect
                             : HttpError::Kind::kProtocol;
  };

  auto deadline = std::chrono::steady_clock::now() + timeout_;

  if (parsed.use_tls) {
    if (!tls_ready_) {
      fail(HttpError::Kind::kProtocol, "TLS not available in HttpClient");
    }
    ssl = SSL_new(ssl_ctx_);
    if (!ssl) {
      fail(HttpError::Kind::kProtocol, "failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(ssl, parsed.host.c_str());
#endif
    SSL_set_fd(ssl, sock);
    if (SSL_connect(ssl) != 1) {
      fail(io_failure_kind(errno), "TLS handshake failed");
    }
    if (SSL_get_verify_result(ssl) != X509_V_OK) {
      fail(HttpError::Kind::kProtocol, "TLS certificate verification failed");
    }
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      int sent = SSL_write(ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        fail(io_failure_kind(errno), "failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[4096];
    while (true) {
      int read_bytes = SSL_read(ssl, buffer, sizeof(buffer));
      if (read_bytes > 0) {
        response.append(buffer, buffer + read_bytes);
      } else {
        int err = SSL_get_error(ssl, read_bytes);
        if (err == SSL_ERROR_ZERO_RETURN) {
          break;
        }
        if (err == SSL_ERROR_SYSCALL && IsTimeoutErrno(errno)) {
          fail(HttpError::Kind::kTimeout, "timed out waiting for response");
        }
        // Peers commonly close without close_notify after Connection: close.
        break;
      }
      if (std::chrono::steady_clock::now() > deadline) {
        fail(HttpError::Kind::kTimeout, "response exceeded timeout");
      }
    }
  } else {
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      // A peer reset must not raise SIGPIPE.
      ssize_t sent = ::send(sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        fail(io_failure_kind(errno), "failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[4096];
    while (true) {
      ssize_t read_bytes = ::recv(sock, buffer, sizeof(buffer), 0);
      if (read_bytes > 0) {
        response.append(buffer, buffer + read_bytes);
      } else if (read_bytes == 0) {
        break;
      } else if (errno == EINTR) {
        continue;
      } else {
        fail(io_failure_kind(errno), IsTimeoutErrno(errno)
                                         ? "timed out waiting for response"
                                         : "failed to read response");
      }
      if (std::chrono::steady_clock::now() > deadline) {
        fail(HttpError::Kind::kTimeout, "response exceeded timeout");
      }
    }
  }

  close_all();
  return ParseResponse(response);
}

} // namespace jdguard
