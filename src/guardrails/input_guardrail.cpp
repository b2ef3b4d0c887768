#include "guardrails/input_guardrail.hpp"

#include <regex>
#include <utility>
#include <vector>

namespace researchguard::guardrails {

namespace {

// Reason text lists at most this many lexicon hits; `matches` keeps all.
constexpr std::size_t kReasonPreviewTerms = 3;

// Inputs every input rule sees. `lowered` is computed once per query.
struct QueryView {
  const std::string& original;
  const std::string& lowered;
};

using InputRuleFn = void (*)(const CompiledInputRules& rules, const QueryView& query,
                             std::vector<Violation>& out);

struct InputRule {
  const char* name;
  InputRuleFn evaluate;
};

std::string JoinPreview(const std::vector<std::string>& terms, std::size_t limit) {
  std::string joined;
  for (std::size_t i = 0; i < terms.size() && i < limit; ++i) {
    if (i != 0U) {
      joined += ", ";
    }
    joined += terms[i];
  }
  return joined;
}

void CheckLength(const CompiledInputRules& rules, const QueryView& query,
                 std::vector<Violation>& out) {
  const std::size_t length = query.original.size();
  if (length < rules.data.min_length) {
    out.push_back({.validator = Validator::kLength,
                   .reason = "Query too short",
                   .severity = Severity::kLow});
  }
  if (length > rules.data.max_length) {
    out.push_back({.validator = Validator::kLength,
                   .reason = "Query too long",
                   .severity = Severity::kMedium});
  }
}

void CheckToxicity(const CompiledInputRules& rules, const QueryView& query,
                   std::vector<Violation>& out) {
  std::vector<std::string> hits = FindLexiconHits(rules.toxic_terms, query.lowered);
  if (hits.empty()) {
    return;
  }
  Violation violation;
  violation.validator = Validator::kToxicity;
  violation.reason =
      "Query may contain harmful content: " + JoinPreview(hits, kReasonPreviewTerms);
  violation.severity = Severity::kHigh;
  violation.matches = std::move(hits);
  out.push_back(std::move(violation));
}

void CheckPromptInjection(const CompiledInputRules& rules, const QueryView& query,
                          std::vector<Violation>& out) {
  for (const auto& pattern : rules.injection_patterns) {
    if (std::regex_search(query.lowered, pattern.regex)) {
      out.push_back({.validator = Validator::kPromptInjection,
                     .reason = "Potential prompt injection detected",
                     .severity = Severity::kHigh});
      // One hit is enough to block; the remaining patterns add nothing.
      return;
    }
  }
}

void CheckRelevance(const CompiledInputRules& rules, const QueryView& query,
                    std::vector<Violation>& out) {
  if (query.original.size() <= rules.data.relevance_min_length) {
    return;
  }
  for (const auto& term : rules.topic_terms) {
    if (query.lowered.find(term) != std::string::npos) {
      return;
    }
  }
  out.push_back({.validator = Validator::kRelevance,
                 .reason = "Query may not be related to the research topic",
                 .severity = rules.data.enforce_topic_relevance ? Severity::kHigh
                                                                : Severity::kLow});
}

constexpr InputRule kInputRules[] = {
    {"length", &CheckLength},
    {"toxicity", &CheckToxicity},
    {"prompt_injection", &CheckPromptInjection},
    {"relevance", &CheckRelevance},
};

} // namespace

InputGuardrail::InputGuardrail(CompiledInputRules rules) : rules_(std::move(rules)) {}

ValidationResult InputGuardrail::Validate(std::string_view query) const {
  const std::string original(query);
  const std::string lowered = ToLowerAscii(query);
  const QueryView view{original, lowered};

  ValidationResult result;
  for (const auto& rule : kInputRules) {
    std::vector<Violation> found;
    try {
      rule.evaluate(rules_, view, found);
    } catch (const std::regex_error& ex) {
      // Fail open for this rule only; the verdict still comes from the
      // rules that could evaluate the query.
      result.rule_errors.push_back(std::string(rule.name) + ": " + ex.what());
      continue;
    }
    for (auto& violation : found) {
      result.violations.push_back(std::move(violation));
    }
  }

  ApplyBlockingPolicy(result);
  if (!result.blocked) {
    result.sanitized_text = original;
  }
  return result;
}

} // namespace researchguard::guardrails
