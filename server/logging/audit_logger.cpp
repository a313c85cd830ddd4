#include "server/logging/audit_logger.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace jdguard {

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
    if (!stream_.is_open()) {
      log::Warn("audit", "cannot open audit log, auditing disabled", "path=" + path);
    }
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::LogDecision(const std::string& identity,
                              const std::string& stage,
                              const std::string& decision,
                              const std::string& reason,
                              const std::string& text) {
  if (!Enabled()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  json j;
  j["timestamp"] = ts;
  j["identity"] = identity;
  j["stage"] = stage;
  j["decision"] = decision;
  j["reason"] = reason;
  j["length"] = text.size();
  if (debug_mode_) {
    j["text"] = text;
  } else {
    j["text_sha256"] = HashContent(text);
    j["preview"] = log::Preview(text, kPreviewChars);
  }
  auto line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace jdguard
