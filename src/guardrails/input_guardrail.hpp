#pragma once

#include "guardrails/rules.hpp"
#include "guardrails/violation.hpp"

#include <string>
#include <string_view>

namespace researchguard::guardrails {

// Validates raw user queries before any generation happens.
//
// Categories: length, toxicity, prompt injection, topic relevance. Every rule
// runs independently and contributes to one violation list; a rule that
// cannot evaluate the text fails open and is reported in `rule_errors`.
// Local and synchronous, no I/O.
class InputGuardrail {
public:
  explicit InputGuardrail(CompiledInputRules rules);

  ValidationResult Validate(std::string_view query) const;

  const InputRules& Rules() const {
    return rules_.data;
  }

private:
  CompiledInputRules rules_;
};

} // namespace researchguard::guardrails
