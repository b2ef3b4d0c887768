#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::guardrails {

// Rule data for the input guardrail. Everything here is plain data supplied
// by configuration; adding a term or pattern never touches engine code.
struct InputRules {
  std::size_t min_length = 5;
  std::size_t max_length = 2000;
  // Relevance is only judged for queries longer than this.
  std::size_t relevance_min_length = 20;
  // Off-topic queries are advisory (low) unless this is set, then high.
  bool enforce_topic_relevance = false;
  std::vector<std::string> toxic_lexicon;
  std::vector<std::string> injection_patterns;
  std::vector<std::string> topic_lexicon;
};

struct PiiPattern {
  std::string type;
  std::string pattern;
};

struct OutputRules {
  std::string redaction_token = "[REDACTED]";
  std::size_t max_reported_matches = 5;
  std::vector<PiiPattern> pii_patterns;
  std::vector<std::string> harmful_lexicon;
  std::vector<std::string> bias_patterns;
};

// Built-in rule sets used when configuration omits a section.
InputRules DefaultInputRules();
OutputRules DefaultOutputRules();

// One compiled matcher. `source` is the configured term or pattern so
// violations can report what matched without exposing regex internals.
struct CompiledPattern {
  std::string source;
  std::regex regex;
};

struct CompiledPiiPattern {
  std::string type;
  CompiledPattern matcher;
};

struct CompiledInputRules {
  InputRules data;
  std::vector<CompiledPattern> toxic_terms;
  std::vector<CompiledPattern> injection_patterns;
  std::vector<std::string> topic_terms;
};

struct CompiledOutputRules {
  OutputRules data;
  std::vector<CompiledPiiPattern> pii_patterns;
  std::vector<CompiledPattern> harmful_terms;
  std::vector<CompiledPattern> bias_patterns;
};

// Compiles a regex pattern (ECMAScript, optionally case-insensitive).
// Returns false with `error` naming the pattern when it does not compile.
bool CompilePattern(const std::string& pattern, bool ignore_case, CompiledPattern& compiled,
                    std::string& error);

// Compiles a lexicon term into a case-insensitive whole-word matcher. Regex
// metacharacters in the term are matched literally.
bool CompileLexiconTerm(const std::string& term, CompiledPattern& compiled, std::string& error);

// Rule-set compilation. Any invalid entry is a configuration error: the
// whole set is rejected and `error` says which entry failed.
bool CompileInputRules(const InputRules& rules, CompiledInputRules& compiled, std::string& error);
bool CompileOutputRules(const OutputRules& rules, CompiledOutputRules& compiled,
                        std::string& error);

// Returns the source terms whose matcher hits `text`, in lexicon order.
// May throw std::regex_error on pathological input; callers fail open.
std::vector<std::string> FindLexiconHits(const std::vector<CompiledPattern>& lexicon,
                                         const std::string& text);

std::string ToLowerAscii(std::string_view text);

} // namespace researchguard::guardrails
