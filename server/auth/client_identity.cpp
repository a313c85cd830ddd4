#include "server/auth/client_identity.h"

#include "server/policy/sanitizer.h"

namespace jdguard {

std::string ResolveClientIdentity(const std::string& forwarded_for,
                                  const std::string& peer_address) {
  if (!TrimWhitespace(forwarded_for).empty()) {
    auto comma = forwarded_for.find(',');
    auto first = TrimWhitespace(forwarded_for.substr(0, comma));
    if (!first.empty()) {
      return first;
    }
  }
  auto peer = TrimWhitespace(peer_address);
  if (!peer.empty()) {
    return peer;
  }
  return "unknown";
}

}  // namespace jdguard
