#include <catch2/catch_test_macros.hpp>

#include "server/policy/input_validator.h"

#include <string>

TEST_CASE("InputValidator rejects blank input", "[input_validator]") {
  jdguard::InputValidator validator(10, 2000);
  std::string reason;
  jdguard::RejectionDetail detail = jdguard::RejectionDetail::kNone;
  REQUIRE(!validator.Validate("", &reason, &detail));
  REQUIRE(reason == "Role details cannot be empty");
  REQUIRE(detail == jdguard::RejectionDetail::kEmpty);

  REQUIRE(!validator.Validate("            \n\t", &reason, &detail));
  REQUIRE(detail == jdguard::RejectionDetail::kEmpty);
}

TEST_CASE("InputValidator rejects short input", "[input_validator]") {
  jdguard::InputValidator validator(10, 2000);
  std::string reason;
  jdguard::RejectionDetail detail = jdguard::RejectionDetail::kNone;
  REQUIRE(!validator.Validate("hi", &reason, &detail));
  REQUIRE(reason == "Role details too short. Minimum 10 characters required");
  REQUIRE(detail == jdguard::RejectionDetail::kTooShort);
}

TEST_CASE("InputValidator length bounds are inclusive", "[input_validator]") {
  jdguard::InputValidator validator(10, 20);
  std::string reason;
  REQUIRE(validator.Validate(std::string(10, 'a'), &reason));
  REQUIRE(validator.Validate(std::string(20, 'a'), &reason));
  REQUIRE(!validator.Validate(std::string(9, 'a'), &reason));

  jdguard::RejectionDetail detail = jdguard::RejectionDetail::kNone;
  REQUIRE(!validator.Validate(std::string(21, 'a'), &reason, &detail));
  REQUIRE(reason == "Role details too long. Maximum 20 characters allowed");
  REQUIRE(detail == jdguard::RejectionDetail::kTooLong);
}

TEST_CASE("InputValidator counts surrounding whitespace", "[input_validator]") {
  jdguard::InputValidator validator(10, 2000);
  std::string reason;
  REQUIRE(validator.Validate("   abc    ", &reason));
}

TEST_CASE("InputValidator requires an ASCII letter or digit", "[input_validator]") {
  jdguard::InputValidator validator(5, 2000);
  std::string reason;
  jdguard::RejectionDetail detail = jdguard::RejectionDetail::kNone;
  REQUIRE(!validator.Validate("!!!!!-----", &reason, &detail));
  REQUIRE(reason == "Role details must contain valid text");
  REQUIRE(detail == jdguard::RejectionDetail::kNoAlphanumeric);

  // Non-ASCII letters alone do not count.
  REQUIRE(!validator.Validate("\xC3\xA9\xC3\xA9\xC3\xA9", &reason, &detail));
  REQUIRE(validator.Validate("#### 42 ####", &reason));
}

TEST_CASE("InputValidator accepts ordinary role details", "[input_validator]") {
  jdguard::InputValidator validator(10, 2000);
  std::string reason;
  jdguard::RejectionDetail detail = jdguard::RejectionDetail::kTooLong;
  REQUIRE(validator.Validate("Senior backend engineer, Go and Kubernetes", &reason,
                             &detail));
  REQUIRE(detail == jdguard::RejectionDetail::kNone);
}

TEST_CASE("ValidateJobTitle", "[input_validator]") {
  REQUIRE(jdguard::InputValidator::ValidateJobTitle("Data Analyst"));
  REQUIRE(jdguard::InputValidator::ValidateJobTitle("SRE"));
  REQUIRE(!jdguard::InputValidator::ValidateJobTitle("QA"));
  REQUIRE(!jdguard::InputValidator::ValidateJobTitle("12345"));
  REQUIRE(!jdguard::InputValidator::ValidateJobTitle(std::string(101, 'a')));
}
