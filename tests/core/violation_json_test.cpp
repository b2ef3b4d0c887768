#include "guardrails/violation.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

TEST_CASE("Validator and severity map to stable string values", "[core][guardrails][json]") {
  using researchguard::guardrails::Severity;
  using researchguard::guardrails::ToString;
  using researchguard::guardrails::Validator;

  REQUIRE(std::string(ToString(Validator::kLength)) == "length");
  REQUIRE(std::string(ToString(Validator::kToxicity)) == "toxicity");
  REQUIRE(std::string(ToString(Validator::kPromptInjection)) == "prompt_injection");
  REQUIRE(std::string(ToString(Validator::kRelevance)) == "relevance");
  REQUIRE(std::string(ToString(Validator::kPii)) == "pii");
  REQUIRE(std::string(ToString(Validator::kHarmfulContent)) == "harmful_content");
  REQUIRE(std::string(ToString(Validator::kBias)) == "bias");
  REQUIRE(std::string(ToString(Severity::kLow)) == "low");
  REQUIRE(std::string(ToString(Severity::kMedium)) == "medium");
  REQUIRE(std::string(ToString(Severity::kHigh)) == "high");
}

TEST_CASE("Severity and validator strings parse back", "[core][guardrails][json]") {
  using namespace researchguard::guardrails;

  Severity severity = Severity::kLow;
  REQUIRE(ParseSeverity("high", severity));
  REQUIRE(severity == Severity::kHigh);
  REQUIRE_FALSE(ParseSeverity("critical", severity));

  Validator validator = Validator::kLength;
  REQUIRE(ParseValidator("prompt_injection", validator));
  REQUIRE(validator == Validator::kPromptInjection);
  REQUIRE_FALSE(ParseValidator("spam", validator));
}

TEST_CASE("Violation JSON omits empty matches and carries pii type", "[core][guardrails][json]") {
  using namespace researchguard::guardrails;

  Violation length;
  length.validator = Validator::kLength;
  length.reason = "Query too short";
  length.severity = Severity::kLow;
  REQUIRE(ToJson(length) == R"({"validator":"length","reason":"Query too short","severity":"low"})");

  Violation pii;
  pii.validator = Validator::kPii;
  pii.reason = "Contains email";
  pii.severity = Severity::kHigh;
  pii.matches = {"jane@example.com"};
  pii.pii_type = "email";
  REQUIRE(
      ToJson(pii) ==
      R"({"validator":"pii","reason":"Contains email","severity":"high","pii_type":"email","matches":["jane@example.com"]})");
}

TEST_CASE("Blocking policy requires a high violation", "[core][guardrails]") {
  using namespace researchguard::guardrails;

  ValidationResult advisory;
  advisory.violations.push_back(
      {.validator = Validator::kLength, .reason = "Query too long", .severity = Severity::kMedium});
  advisory.violations.push_back({.validator = Validator::kRelevance,
                                 .reason = "Query may not be related to the research topic",
                                 .severity = Severity::kLow});
  ApplyBlockingPolicy(advisory);
  REQUIRE_FALSE(advisory.blocked);
  REQUIRE(advisory.valid);

  ValidationResult blocking = advisory;
  blocking.violations.push_back({.validator = Validator::kToxicity,
                                 .reason = "Query may contain harmful content: kill",
                                 .severity = Severity::kHigh});
  ApplyBlockingPolicy(blocking);
  REQUIRE(blocking.blocked);

  const Violation* worst = FindWorstViolation(blocking.violations);
  REQUIRE(worst != nullptr);
  REQUIRE(worst->validator == Validator::kToxicity);
  REQUIRE(FindWorstViolation({}) == nullptr);
}
