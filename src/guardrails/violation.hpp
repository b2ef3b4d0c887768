#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::guardrails {

// Ordinal policy weight. Only kHigh forces blocking.
enum class Severity {
  kLow = 0,
  kMedium = 1,
  kHigh = 2,
};

// Rule category that produced a violation. The string forms are part of the
// audit-log contract and must stay stable.
enum class Validator {
  kLength,
  kToxicity,
  kPromptInjection,
  kRelevance,
  kPii,
  kHarmfulContent,
  kBias,
};

struct Violation {
  Validator validator = Validator::kLength;
  std::string reason;
  Severity severity = Severity::kLow;
  std::vector<std::string> matches;
  // Set for kPii only: email, phone, ssn, credit_card, ...
  std::optional<std::string> pii_type;
};

// Outcome of one guardrail pass. Created per call and never mutated after
// the guardrail returns it.
struct ValidationResult {
  bool valid = true;
  bool blocked = false;
  std::vector<Violation> violations;
  // Input: the query when not blocked. Output: always the redacted text.
  std::optional<std::string> sanitized_text;
  // Rules that could not evaluate this text and failed open.
  std::vector<std::string> rule_errors;
};

const char* ToString(Severity severity);
const char* ToString(Validator validator);

bool ParseSeverity(std::string_view raw, Severity& severity);
bool ParseValidator(std::string_view raw, Validator& validator);

// True iff any violation is high severity.
bool HasBlockingViolation(const std::vector<Violation>& violations);

// Highest-severity violation; the first one wins on ties. nullptr if empty.
const Violation* FindWorstViolation(const std::vector<Violation>& violations);

// Fills valid/blocked from the collected violations.
void ApplyBlockingPolicy(ValidationResult& result);

std::string ToJson(const Violation& violation);
std::string ToJson(const std::vector<Violation>& violations);

} // namespace researchguard::guardrails
