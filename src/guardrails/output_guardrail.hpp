#pragma once

#include "guardrails/rules.hpp"
#include "guardrails/violation.hpp"

#include <string>
#include <string_view>

namespace researchguard::guardrails {

// Validates and sanitizes generated text before it reaches the user.
//
// Categories: PII (one violation per configured class), harmful content and
// biased phrasing. `Validate` always fills `sanitized_text`, even when the
// response is not blocked, so PII redaction can never be skipped.
class OutputGuardrail {
public:
  explicit OutputGuardrail(CompiledOutputRules rules);

  ValidationResult Validate(std::string_view response) const;

  // Replaces every PII match span with the redaction token. Overlapping
  // spans from different classes collapse into one token.
  // Idempotent: Sanitize(Sanitize(x)) == Sanitize(x).
  std::string Sanitize(std::string_view text) const;

  const OutputRules& Rules() const {
    return rules_.data;
  }

private:
  CompiledOutputRules rules_;
};

} // namespace researchguard::guardrails
