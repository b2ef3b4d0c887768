#include "common/assertions.hpp"
#include "common/pipeline_fixtures.hpp"
#include "guardrails/output_guardrail.hpp"

#include <string>

namespace {

using researchguard::guardrails::Severity;
using researchguard::guardrails::ValidationResult;
using researchguard::guardrails::Validator;
using researchguard::guardrails::Violation;
using researchguard::tests::common::AssertContains;
using researchguard::tests::common::AssertNotContains;
using researchguard::tests::common::Fail;

const Violation* FindPii(const ValidationResult& result, const std::string& type) {
  for (const auto& violation : result.violations) {
    if (violation.validator == Validator::kPii && violation.pii_type == type) {
      return &violation;
    }
  }
  return nullptr;
}

} // namespace

int main() {
  const auto guardrail = researchguard::tests::common::MakeOutputGuardrail();

  {
    const std::string clean = "Card sorting helps designers group navigation labels.";
    const ValidationResult result = guardrail.Validate(clean);
    if (result.blocked || !result.violations.empty()) {
      Fail("clean response should pass");
    }
    if (result.sanitized_text.value_or("") != clean) {
      Fail("clean response should be returned unchanged");
    }
  }

  {
    const ValidationResult result =
        guardrail.Validate("Contact jane.doe@example.com or 555-123-4567 for the dataset.");
    const Violation* email = FindPii(result, "email");
    const Violation* phone = FindPii(result, "phone");
    if (email == nullptr || phone == nullptr) {
      Fail("expected email and phone PII violations");
    }
    if (email->severity != Severity::kHigh || !result.blocked) {
      Fail("PII must be high severity and block");
    }
    if (email->matches.size() != 1U || email->matches.front() != "jane.doe@example.com") {
      Fail("email violation should carry the matched address");
    }
    const std::string sanitized = result.sanitized_text.value_or("");
    if (sanitized != "Contact [REDACTED] or [REDACTED] for the dataset.") {
      Fail("unexpected sanitized text: " + sanitized);
    }
    if (guardrail.Sanitize(sanitized) != sanitized) {
      Fail("sanitize must be idempotent");
    }
  }

  {
    const ValidationResult result = guardrail.Validate("SSN on file: 123-45-6789.");
    if (FindPii(result, "ssn") == nullptr) {
      Fail("expected ssn violation");
    }
    AssertNotContains(result.sanitized_text.value_or(""), "6789");
  }

  {
    const ValidationResult result = guardrail.Validate("Pay with 4111 1111 1111 1111 today.");
    if (FindPii(result, "credit_card") == nullptr) {
      Fail("expected credit_card violation");
    }
    AssertContains(result.sanitized_text.value_or(""), "Pay with [REDACTED] today.");
  }

  {
    std::string many;
    for (int i = 0; i < 7; ++i) {
      many += "user" + std::to_string(i) + "@example.org ";
    }
    const ValidationResult result = guardrail.Validate(many);
    const Violation* email = FindPii(result, "email");
    if (email == nullptr || email->matches.size() != 5U) {
      Fail("PII matches should be capped at five");
    }
    AssertNotContains(result.sanitized_text.value_or(""), "@example.org");
  }

  {
    const ValidationResult result =
        guardrail.Validate("An attack on the login form was simulated during the study.");
    if (result.blocked || result.violations.size() != 1U ||
        result.violations.front().validator != Validator::kHarmfulContent ||
        result.violations.front().severity != Severity::kMedium) {
      Fail("harmful vocabulary in a response should be a medium finding");
    }
  }

  {
    const ValidationResult result =
        guardrail.Validate("All women are less interested in settings menus.");
    if (result.blocked || result.violations.size() != 1U ||
        result.violations.front().validator != Validator::kBias) {
      Fail("biased generalization should be a single medium finding");
    }
  }

  {
    // Overlapping spans from different classes collapse into one token.
    researchguard::guardrails::OutputRules rules;
    rules.pii_patterns = {{"prefixed", R"(abc\d+)"}, {"suffixed", R"(\d+xyz)"}};
    const auto overlapping = researchguard::tests::common::MakeOutputGuardrail(rules);
    if (overlapping.Sanitize("id abc123xyz end") != "id [REDACTED] end") {
      Fail("overlapping PII spans should be merged before redaction");
    }
  }

  {
    researchguard::guardrails::OutputRules rules = researchguard::guardrails::DefaultOutputRules();
    rules.redaction_token = "<pii>";
    const auto custom = researchguard::tests::common::MakeOutputGuardrail(rules);
    if (custom.Sanitize("mail bob@example.com") != "mail <pii>") {
      Fail("configured redaction token should be used");
    }
  }

  std::cout << "output_guardrail_smoke: ok\n";
  return 0;
}
