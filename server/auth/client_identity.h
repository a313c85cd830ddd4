#pragma once

#include <string>

namespace jdguard {

// Rate-limit key for a request. The first entry of a non-blank
// X-Forwarded-For value wins, then the peer address, then "unknown".
std::string ResolveClientIdentity(const std::string& forwarded_for,
                                  const std::string& peer_address);

}  // namespace jdguard
