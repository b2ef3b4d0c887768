#include "guardrails/violation.hpp"

#include "core/json_utils.hpp"

#include <sstream>

namespace researchguard::guardrails {

const char* ToString(Severity severity) {
  switch (severity) {
  case Severity::kLow:
    return "low";
  case Severity::kMedium:
    return "medium";
  case Severity::kHigh:
    return "high";
  }

  return "low";
}

const char* ToString(Validator validator) {
  switch (validator) {
  case Validator::kLength:
    return "length";
  case Validator::kToxicity:
    return "toxicity";
  case Validator::kPromptInjection:
    return "prompt_injection";
  case Validator::kRelevance:
    return "relevance";
  case Validator::kPii:
    return "pii";
  case Validator::kHarmfulContent:
    return "harmful_content";
  case Validator::kBias:
    return "bias";
  }

  return "unknown";
}

bool ParseSeverity(std::string_view raw, Severity& severity) {
  if (raw == "low") {
    severity = Severity::kLow;
    return true;
  }
  if (raw == "medium") {
    severity = Severity::kMedium;
    return true;
  }
  if (raw == "high") {
    severity = Severity::kHigh;
    return true;
  }
  return false;
}

bool ParseValidator(std::string_view raw, Validator& validator) {
  for (const Validator candidate :
       {Validator::kLength, Validator::kToxicity, Validator::kPromptInjection,
        Validator::kRelevance, Validator::kPii, Validator::kHarmfulContent, Validator::kBias}) {
    if (raw == ToString(candidate)) {
      validator = candidate;
      return true;
    }
  }
  return false;
}

bool HasBlockingViolation(const std::vector<Violation>& violations) {
  for (const auto& violation : violations) {
    if (violation.severity == Severity::kHigh) {
      return true;
    }
  }
  return false;
}

const Violation* FindWorstViolation(const std::vector<Violation>& violations) {
  const Violation* worst = nullptr;
  for (const auto& violation : violations) {
    if (worst == nullptr ||
        static_cast<int>(violation.severity) > static_cast<int>(worst->severity)) {
      worst = &violation;
    }
  }
  return worst;
}

void ApplyBlockingPolicy(ValidationResult& result) {
  result.blocked = HasBlockingViolation(result.violations);
  result.valid = !result.blocked;
}

std::string ToJson(const Violation& violation) {
  std::ostringstream out;
  out << "{\"validator\":" << core::QuoteJson(ToString(violation.validator))
      << ",\"reason\":" << core::QuoteJson(violation.reason)
      << ",\"severity\":" << core::QuoteJson(ToString(violation.severity));
  if (violation.pii_type.has_value()) {
    out << ",\"pii_type\":" << core::QuoteJson(violation.pii_type.value());
  }
  // `matches` is optional in the record contract; omit it rather than emit [].
  if (!violation.matches.empty()) {
    out << ",\"matches\":" << core::ToJsonStringArray(violation.matches);
  }
  out << '}';
  return out.str();
}

std::string ToJson(const std::vector<Violation>& violations) {
  std::string out = "[";
  for (std::size_t i = 0; i < violations.size(); ++i) {
    if (i != 0U) {
      out += ',';
    }
    out += ToJson(violations[i]);
  }
  out += ']';
  return out;
}

} // namespace researchguard::guardrails
