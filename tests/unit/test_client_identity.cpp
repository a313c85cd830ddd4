#include <catch2/catch_test_macros.hpp>

#include "server/auth/client_identity.h"

TEST_CASE("Forwarded-for first entry wins", "[identity]") {
  REQUIRE(jdguard::ResolveClientIdentity("203.0.113.7, 10.0.0.1", "10.0.0.9") ==
          "203.0.113.7");
  REQUIRE(jdguard::ResolveClientIdentity("  198.51.100.2  ", "10.0.0.9") ==
          "198.51.100.2");
}

TEST_CASE("Peer address used without forwarded-for", "[identity]") {
  REQUIRE(jdguard::ResolveClientIdentity("", "10.0.0.9") == "10.0.0.9");
  REQUIRE(jdguard::ResolveClientIdentity("   ", "10.0.0.9") == "10.0.0.9");
  // An empty first entry is not an identity.
  REQUIRE(jdguard::ResolveClientIdentity(" , 10.0.0.1", "10.0.0.9") == "10.0.0.9");
}

TEST_CASE("Unknown identity when nothing is known", "[identity]") {
  REQUIRE(jdguard::ResolveClientIdentity("", "") == "unknown");
}
