#include "guardrails/rules.hpp"

#include <algorithm>
#include <cctype>

namespace researchguard::guardrails {

namespace {

std::string EscapeRegexLiteral(std::string_view literal) {
  static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
  std::string escaped;
  escaped.reserve(literal.size() * 2U);
  for (const char c : literal) {
    if (kSpecial.find(c) != std::string_view::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

bool CompileLexicon(const std::vector<std::string>& terms, std::string_view list_name,
                    std::vector<CompiledPattern>& compiled, std::string& error) {
  compiled.clear();
  compiled.reserve(terms.size());
  for (const auto& term : terms) {
    if (term.empty()) {
      error = std::string(list_name) + " contains an empty term";
      return false;
    }
    CompiledPattern entry;
    if (!CompileLexiconTerm(term, entry, error)) {
      error = std::string(list_name) + ": " + error;
      return false;
    }
    compiled.push_back(std::move(entry));
  }
  return true;
}

bool CompilePatternList(const std::vector<std::string>& patterns, std::string_view list_name,
                        std::vector<CompiledPattern>& compiled, std::string& error) {
  compiled.clear();
  compiled.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    CompiledPattern entry;
    if (!CompilePattern(pattern, /*ignore_case=*/true, entry, error)) {
      error = std::string(list_name) + ": " + error;
      return false;
    }
    compiled.push_back(std::move(entry));
  }
  return true;
}

} // namespace

InputRules DefaultInputRules() {
  InputRules rules;
  rules.toxic_lexicon = {
      // violence
      "kill", "murder", "attack", "harm", "hurt", "violence", "weapon",
      // hate
      "hate", "racist", "sexist", "discrimination",
      // illegal activity
      "hack", "crack", "steal", "fraud", "illegal",
      // self-harm
      "suicide", "self-harm",
  };
  rules.injection_patterns = {
      R"(ignore\s+(all\s+)?previous\s+instructions?)",
      R"(disregard\s+(all\s+)?previous)",
      R"(forget\s+everything)",
      R"(you\s+are\s+now)",
      R"(act\s+as\s+if)",
      R"(pretend\s+you)",
      R"(system:\s*)",
      R"(<\s*system\s*>)",
      R"(\[system\])",
      R"(sudo\s+)",
      R"(admin\s+mode)",
      R"(override\s+safety)",
      R"(jailbreak)",
  };
  rules.topic_lexicon = {
      "user",     "interface",     "design",        "usability", "accessibility",
      "interaction", "experience", "ux",            "ui",        "human",
      "computer", "hci",           "research",      "study",     "evaluation",
      "prototype", "mobile",       "web",           "app",       "software",
      "system",   "technology",    "ai",            "ml",        "machine learning",
      "artificial intelligence",   "visualization", "data",      "display",
      "screen",   "input",         "output",
  };
  return rules;
}

OutputRules DefaultOutputRules() {
  OutputRules rules;
  rules.pii_patterns = {
      {"email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"},
      {"phone", R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)"},
      {"ssn", R"(\b\d{3}-\d{2}-\d{4}\b)"},
      {"credit_card", R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)"},
  };
  rules.harmful_lexicon = {
      "kill", "murder", "attack", "harm", "weapon", "bomb", "explosive", "poison", "torture",
  };
  rules.bias_patterns = {
      R"(\b(all|every)\s+(men|women|blacks|whites|asians)\s+(are|always)\b)",
      R"(\b(never|always)\s+trust\s+(men|women|people\s+from)\b)",
      R"(\bstereotyp(e|ing|ical)\b)",
  };
  return rules;
}

bool CompilePattern(const std::string& pattern, bool ignore_case, CompiledPattern& compiled,
                    std::string& error) {
  if (pattern.empty()) {
    error = "pattern must not be empty";
    return false;
  }

  auto flags = std::regex::ECMAScript | std::regex::optimize;
  if (ignore_case) {
    flags |= std::regex::icase;
  }

  try {
    compiled.regex = std::regex(pattern, flags);
  } catch (const std::regex_error& ex) {
    error = "invalid pattern '" + pattern + "': " + ex.what();
    return false;
  }
  compiled.source = pattern;
  return true;
}

bool CompileLexiconTerm(const std::string& term, CompiledPattern& compiled, std::string& error) {
  const std::string pattern = "\\b" + EscapeRegexLiteral(ToLowerAscii(term)) + "\\b";
  if (!CompilePattern(pattern, /*ignore_case=*/true, compiled, error)) {
    return false;
  }
  compiled.source = term;
  return true;
}

bool CompileInputRules(const InputRules& rules, CompiledInputRules& compiled,
                       std::string& error) {
  if (rules.max_length == 0U || rules.min_length > rules.max_length) {
    error = "input_rules: min_length must not exceed max_length and max_length must be > 0";
    return false;
  }

  CompiledInputRules result;
  result.data = rules;
  if (!CompileLexicon(rules.toxic_lexicon, "toxic_lexicon", result.toxic_terms, error) ||
      !CompilePatternList(rules.injection_patterns, "injection_patterns",
                          result.injection_patterns, error)) {
    return false;
  }

  // Topic relevance is a plain substring count, so terms only need folding.
  result.topic_terms.reserve(rules.topic_lexicon.size());
  for (const auto& term : rules.topic_lexicon) {
    if (term.empty()) {
      error = "topic_lexicon contains an empty term";
      return false;
    }
    result.topic_terms.push_back(ToLowerAscii(term));
  }

  compiled = std::move(result);
  return true;
}

bool CompileOutputRules(const OutputRules& rules, CompiledOutputRules& compiled,
                        std::string& error) {
  if (rules.redaction_token.empty()) {
    error = "output_rules: redaction_token must not be empty";
    return false;
  }

  CompiledOutputRules result;
  result.data = rules;
  result.pii_patterns.reserve(rules.pii_patterns.size());
  for (const auto& pii : rules.pii_patterns) {
    if (pii.type.empty()) {
      error = "pii_patterns: entry type must not be empty";
      return false;
    }
    CompiledPiiPattern entry;
    entry.type = pii.type;
    // PII classes are structural; case folding only matters for emails and
    // is already spelled out in their character classes.
    if (!CompilePattern(pii.pattern, /*ignore_case=*/false, entry.matcher, error)) {
      error = "pii_patterns." + pii.type + ": " + error;
      return false;
    }
    result.pii_patterns.push_back(std::move(entry));
  }

  if (!CompileLexicon(rules.harmful_lexicon, "harmful_lexicon", result.harmful_terms, error) ||
      !CompilePatternList(rules.bias_patterns, "bias_patterns", result.bias_patterns, error)) {
    return false;
  }

  // The redaction token must be inert under every PII matcher, otherwise
  // sanitizing twice would keep rewriting the placeholder.
  for (const auto& pii : result.pii_patterns) {
    if (std::regex_search(rules.redaction_token, pii.matcher.regex)) {
      error = "output_rules: redaction_token matches pii pattern '" + pii.type + "'";
      return false;
    }
  }

  compiled = std::move(result);
  return true;
}

std::vector<std::string> FindLexiconHits(const std::vector<CompiledPattern>& lexicon,
                                         const std::string& text) {
  std::vector<std::string> hits;
  for (const auto& term : lexicon) {
    if (std::regex_search(text, term.regex)) {
      hits.push_back(term.source);
    }
  }
  return hits;
}

std::string ToLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

} // namespace researchguard::guardrails
