#include "guardrails/output_guardrail.hpp"

#include <algorithm>
#include <regex>
#include <utility>
#include <vector>

namespace researchguard::guardrails {

namespace {

struct Span {
  std::size_t begin = 0;
  std::size_t end = 0;
};

using OutputRuleFn = void (*)(const CompiledOutputRules& rules, const std::string& text,
                              const std::string& lowered, std::vector<Violation>& out);

struct OutputRule {
  const char* name;
  OutputRuleFn evaluate;
};

void CheckPii(const CompiledOutputRules& rules, const std::string& text,
              const std::string& /*lowered*/, std::vector<Violation>& out) {
  for (const auto& pii : rules.pii_patterns) {
    std::vector<std::string> matches;
    const auto begin = std::sregex_iterator(text.begin(), text.end(), pii.matcher.regex);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      if (matches.size() >= rules.data.max_reported_matches) {
        break;
      }
      matches.push_back(it->str());
    }
    if (matches.empty()) {
      continue;
    }

    Violation violation;
    violation.validator = Validator::kPii;
    violation.reason = "Contains " + pii.type;
    violation.severity = Severity::kHigh;
    violation.matches = std::move(matches);
    violation.pii_type = pii.type;
    out.push_back(std::move(violation));
  }
}

void CheckHarmfulContent(const CompiledOutputRules& rules, const std::string& /*text*/,
                         const std::string& lowered, std::vector<Violation>& out) {
  std::vector<std::string> hits = FindLexiconHits(rules.harmful_terms, lowered);
  if (hits.empty()) {
    return;
  }
  // Medium on output; the same vocabulary is high on input.
  Violation violation;
  violation.validator = Validator::kHarmfulContent;
  violation.reason = "Response may contain harmful content";
  violation.severity = Severity::kMedium;
  violation.matches = std::move(hits);
  out.push_back(std::move(violation));
}

void CheckBias(const CompiledOutputRules& rules, const std::string& /*text*/,
               const std::string& lowered, std::vector<Violation>& out) {
  for (const auto& pattern : rules.bias_patterns) {
    if (std::regex_search(lowered, pattern.regex)) {
      out.push_back({.validator = Validator::kBias,
                     .reason = "Response may contain biased language",
                     .severity = Severity::kMedium});
      return;
    }
  }
}

constexpr OutputRule kOutputRules[] = {
    {"pii", &CheckPii},
    {"harmful_content", &CheckHarmfulContent},
    {"bias", &CheckBias},
};

std::vector<Span> CollectPiiSpans(const CompiledOutputRules& rules, const std::string& text) {
  std::vector<Span> spans;
  for (const auto& pii : rules.pii_patterns) {
    const auto begin = std::sregex_iterator(text.begin(), text.end(), pii.matcher.regex);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      if (it->length() == 0) {
        continue;
      }
      const auto position = static_cast<std::size_t>(it->position());
      spans.push_back({position, position + static_cast<std::size_t>(it->length())});
    }
  }

  std::sort(spans.begin(), spans.end(),
            [](const Span& a, const Span& b) { return a.begin < b.begin; });

  std::vector<Span> merged;
  for (const auto& span : spans) {
    if (!merged.empty() && span.begin <= merged.back().end) {
      merged.back().end = std::max(merged.back().end, span.end);
    } else {
      merged.push_back(span);
    }
  }
  return merged;
}

} // namespace

OutputGuardrail::OutputGuardrail(CompiledOutputRules rules) : rules_(std::move(rules)) {}

ValidationResult OutputGuardrail::Validate(std::string_view response) const {
  const std::string text(response);
  const std::string lowered = ToLowerAscii(response);

  ValidationResult result;
  for (const auto& rule : kOutputRules) {
    std::vector<Violation> found;
    try {
      rule.evaluate(rules_, text, lowered, found);
    } catch (const std::regex_error& ex) {
      result.rule_errors.push_back(std::string(rule.name) + ": " + ex.what());
      continue;
    }
    for (auto& violation : found) {
      result.violations.push_back(std::move(violation));
    }
  }

  ApplyBlockingPolicy(result);

  try {
    result.sanitized_text = Sanitize(text);
  } catch (const std::regex_error& ex) {
    // Redaction never fails open. Without a sanitized copy the whole text is
    // withheld and the failure counts as a blocking PII finding.
    result.rule_errors.push_back(std::string("sanitize: ") + ex.what());
    result.violations.push_back({.validator = Validator::kPii,
                                 .reason = "PII redaction could not be applied",
                                 .severity = Severity::kHigh});
    result.sanitized_text = rules_.data.redaction_token;
    ApplyBlockingPolicy(result);
  }
  return result;
}

std::string OutputGuardrail::Sanitize(std::string_view text) const {
  const std::string original(text);
  const std::vector<Span> spans = CollectPiiSpans(rules_, original);
  if (spans.empty()) {
    return original;
  }

  std::string sanitized;
  sanitized.reserve(original.size());
  std::size_t cursor = 0;
  for (const auto& span : spans) {
    sanitized.append(original, cursor, span.begin - cursor);
    sanitized += rules_.data.redaction_token;
    cursor = span.end;
  }
  sanitized.append(original, cursor, std::string::npos);
  return sanitized;
}

} // namespace researchguard::guardrails
