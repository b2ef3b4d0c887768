#include "config/app_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace researchguard::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(std::vector<ConfigIssue>& issues, std::string path, std::string message) {
  issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string Join(std::string_view parent, std::string_view key) {
  return std::string(parent) + "." + std::string(key);
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (!value.IsNumber()) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Section lookup: absent is fine, present-but-not-object is an issue.
const JsonValue* GetSection(const JsonValue& root, std::string_view key,
                            std::vector<ConfigIssue>& issues) {
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(issues, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ReadBool(const JsonValue& section, std::string_view parent, std::string_view key, bool& out,
              std::vector<ConfigIssue>& issues) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsBool()) {
    AddIssue(issues, Join(parent, key), "must be a boolean");
    return;
  }
  out = field->bool_value;
}

void ReadString(const JsonValue& section, std::string_view parent, std::string_view key,
                std::string& out, std::vector<ConfigIssue>& issues) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsString()) {
    AddIssue(issues, Join(parent, key), "must be a string");
    return;
  }
  out = field->string_value;
}

template <typename Integer>
void ReadCount(const JsonValue& section, std::string_view parent, std::string_view key,
               std::uint64_t min_value, Integer& out, std::vector<ConfigIssue>& issues) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(issues, Join(parent, key), "must be a non-negative integer");
    return;
  }
  if (parsed < min_value) {
    AddIssue(issues, Join(parent, key), "must be >= " + std::to_string(min_value));
    return;
  }
  out = static_cast<Integer>(parsed);
}

void ReadStringList(const JsonValue& section, std::string_view parent, std::string_view key,
                    std::vector<std::string>& out, std::vector<ConfigIssue>& issues) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  std::vector<std::string> values;
  if (!core::json::ReadStringArray(*field, values)) {
    AddIssue(issues, Join(parent, key), "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i].empty()) {
      AddIssue(issues, Join(parent, key) + "[" + std::to_string(i) + "]", "must not be empty");
      return;
    }
  }
  out = std::move(values);
}

void RejectUnknownKeys(const JsonValue& object, std::string_view parent,
                       const std::set<std::string>& known, std::vector<ConfigIssue>& issues) {
  for (const auto& entry : object.object_value) {
    const std::string& key = entry.first;
    if (known.count(key) == 0U) {
      AddIssue(issues, parent.empty() ? key : Join(parent, key), "is not a recognized field");
    }
  }
}

void LoadSafety(const JsonValue& root, AppConfig& config, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "safety", issues);
  if (section == nullptr) {
    return;
  }
  RejectUnknownKeys(*section, "safety", {"enabled", "log_events", "audit_log", "on_violation"},
                    issues);
  ReadBool(*section, "safety", "enabled", config.safety.enabled, issues);
  ReadBool(*section, "safety", "log_events", config.safety.log_events, issues);
  ReadString(*section, "safety", "audit_log", config.audit_log, issues);

  const JsonValue* on_violation = section->Find("on_violation");
  if (on_violation == nullptr) {
    return;
  }
  if (!on_violation->IsObject()) {
    AddIssue(issues, "safety.on_violation", "must be an object with action and message");
    return;
  }
  if (const JsonValue* action = on_violation->Find("action"); action != nullptr) {
    if (!action->IsString() ||
        !safety::ParseViolationAction(action->string_value, config.safety.action)) {
      AddIssue(issues, "safety.on_violation.action", "must be one of refuse|sanitize");
    }
  }
  ReadString(*on_violation, "safety.on_violation", "message", config.safety.refusal_message,
             issues);
  if (config.safety.refusal_message.empty()) {
    AddIssue(issues, "safety.on_violation.message", "must not be empty");
  }
}

void LoadInputRules(const JsonValue& root, AppConfig& config, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "input_rules", issues);
  if (section == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "input_rules";
  guardrails::InputRules& rules = config.input_rules;
  RejectUnknownKeys(*section, kPath,
                    {"min_length", "max_length", "relevance_min_length",
                     "enforce_topic_relevance", "toxic_lexicon", "injection_patterns",
                     "topic_lexicon"},
                    issues);
  ReadCount(*section, kPath, "min_length", 0U, rules.min_length, issues);
  ReadCount(*section, kPath, "max_length", 1U, rules.max_length, issues);
  ReadCount(*section, kPath, "relevance_min_length", 0U, rules.relevance_min_length, issues);
  ReadBool(*section, kPath, "enforce_topic_relevance", rules.enforce_topic_relevance, issues);
  ReadStringList(*section, kPath, "toxic_lexicon", rules.toxic_lexicon, issues);
  ReadStringList(*section, kPath, "injection_patterns", rules.injection_patterns, issues);
  ReadStringList(*section, kPath, "topic_lexicon", rules.topic_lexicon, issues);
}

// Accepts either an ordered array of {"type","pattern"} objects or an object
// keyed by type (applied in key order).
void LoadPiiPatterns(const JsonValue& field, std::vector<guardrails::PiiPattern>& out,
                     std::vector<ConfigIssue>& issues) {
  constexpr const char* kPath = "output_rules.pii_patterns";
  std::vector<guardrails::PiiPattern> patterns;
  if (field.IsObject()) {
    for (const auto& [type, pattern] : field.object_value) {
      if (!pattern.IsString() || pattern.string_value.empty()) {
        AddIssue(issues, std::string(kPath) + "." + type, "must be a non-empty regex string");
        return;
      }
      patterns.push_back({.type = type, .pattern = pattern.string_value});
    }
  } else if (field.IsArray()) {
    for (std::size_t i = 0; i < field.array_value.size(); ++i) {
      const JsonValue& item = field.array_value[i];
      const std::string item_path = std::string(kPath) + "[" + std::to_string(i) + "]";
      const JsonValue* type = item.Find("type");
      const JsonValue* pattern = item.Find("pattern");
      if (type == nullptr || !type->IsString() || type->string_value.empty() ||
          pattern == nullptr || !pattern->IsString() || pattern->string_value.empty()) {
        AddIssue(issues, item_path, "must be an object with non-empty type and pattern strings");
        return;
      }
      patterns.push_back({.type = type->string_value, .pattern = pattern->string_value});
    }
  } else {
    AddIssue(issues, kPath, "must be an object keyed by PII type or an array");
    return;
  }
  out = std::move(patterns);
}

void LoadOutputRules(const JsonValue& root, AppConfig& config, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "output_rules", issues);
  if (section == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "output_rules";
  guardrails::OutputRules& rules = config.output_rules;
  RejectUnknownKeys(*section, kPath,
                    {"redaction_token", "max_reported_matches", "pii_patterns",
                     "harmful_lexicon", "bias_patterns"},
                    issues);
  ReadString(*section, kPath, "redaction_token", rules.redaction_token, issues);
  ReadCount(*section, kPath, "max_reported_matches", 1U, rules.max_reported_matches, issues);
  if (const JsonValue* pii = section->Find("pii_patterns"); pii != nullptr) {
    LoadPiiPatterns(*pii, rules.pii_patterns, issues);
  }
  ReadStringList(*section, kPath, "harmful_lexicon", rules.harmful_lexicon, issues);
  ReadStringList(*section, kPath, "bias_patterns", rules.bias_patterns, issues);
}

void LoadConversation(const JsonValue& root, AppConfig& config,
                      std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "conversation", issues);
  if (section == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "conversation";
  agents::CoordinatorConfig& conversation = config.conversation;
  RejectUnknownKeys(*section, kPath,
                    {"max_rounds", "termination_token", "max_citations",
                     "max_generation_attempts", "initial_backoff_ms", "request_timeout_ms",
                     "max_tool_calls_per_turn"},
                    issues);
  ReadCount(*section, kPath, "max_rounds", 1U, conversation.termination.max_rounds, issues);
  ReadString(*section, kPath, "termination_token", conversation.termination.termination_token,
             issues);
  if (conversation.termination.termination_token.empty()) {
    AddIssue(issues, "conversation.termination_token", "must not be empty");
  }
  ReadCount(*section, kPath, "max_citations", 0U, conversation.max_citations, issues);
  ReadCount(*section, kPath, "max_generation_attempts", 1U, conversation.retry.max_attempts,
            issues);
  std::uint64_t backoff_ms = static_cast<std::uint64_t>(conversation.retry.initial_backoff.count());
  ReadCount(*section, kPath, "initial_backoff_ms", 0U, backoff_ms, issues);
  conversation.retry.initial_backoff =
      std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(backoff_ms));
  std::uint64_t timeout_ms = static_cast<std::uint64_t>(conversation.request_timeout.count());
  ReadCount(*section, kPath, "request_timeout_ms", 0U, timeout_ms, issues);
  conversation.request_timeout =
      std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(timeout_ms));
  ReadCount(*section, kPath, "max_tool_calls_per_turn", 0U, conversation.max_tool_calls_per_turn,
            issues);
}

void LoadAgents(const JsonValue& root, AppConfig& config, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "agents", issues);
  if (section == nullptr) {
    return;
  }
  for (const auto& [name, agent] : section->object_value) {
    const std::string path = Join("agents", name);
    agents::AgentRole role = agents::AgentRole::kPlanner;
    if (!agents::ParseAgentRole(name, role)) {
      AddIssue(issues, path, "is not a known role (expected planner|researcher|writer|critic)");
      continue;
    }
    if (!agent.IsObject()) {
      AddIssue(issues, path, "must be an object");
      continue;
    }
    RejectUnknownKeys(agent, path, {"directive"}, issues);
    std::string directive;
    ReadString(agent, path, "directive", directive, issues);
    if (!directive.empty()) {
      config.conversation.directives.Set(role, std::move(directive));
    }
  }
}

void LoadLogging(const JsonValue& root, AppConfig& config, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = GetSection(root, "logging", issues);
  if (section == nullptr) {
    return;
  }
  RejectUnknownKeys(*section, "logging", {"level"}, issues);
  std::string level;
  ReadString(*section, "logging", "level", level, issues);
  if (level.empty()) {
    return;
  }
  std::string level_error;
  if (!core::logging::ParseLogLevel(level, config.log_level, level_error)) {
    AddIssue(issues, "logging.level", level_error);
  }
}

} // namespace

bool LoadAppConfigText(std::string_view json_text, AppConfig& config,
                       std::vector<ConfigIssue>& issues) {
  issues.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(issues, "$", parse_error);
    return false;
  }
  if (!root.IsObject()) {
    AddIssue(issues, "$", "config root must be a JSON object");
    return false;
  }

  AppConfig loaded;
  RejectUnknownKeys(root, "",
                    {"safety", "input_rules", "output_rules", "conversation", "agents",
                     "logging"},
                    issues);
  LoadSafety(root, loaded, issues);
  LoadInputRules(root, loaded, issues);
  LoadOutputRules(root, loaded, issues);
  LoadConversation(root, loaded, issues);
  LoadAgents(root, loaded, issues);
  LoadLogging(root, loaded, issues);
  if (!issues.empty()) {
    return false;
  }

  CompiledRules compiled;
  if (!CompileRules(loaded, compiled, issues)) {
    return false;
  }

  config = std::move(loaded);
  return true;
}

bool LoadAppConfigFile(const std::filesystem::path& path, AppConfig& config,
                       std::vector<ConfigIssue>& issues) {
  issues.clear();
  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(path, text, read_error)) {
    AddIssue(issues, "$", read_error);
    return false;
  }
  return LoadAppConfigText(text, config, issues);
}

bool CompileRules(const AppConfig& config, CompiledRules& compiled,
                  std::vector<ConfigIssue>& issues) {
  bool ok = true;
  std::string error;
  if (!guardrails::CompileInputRules(config.input_rules, compiled.input, error)) {
    AddIssue(issues, "input_rules", error);
    ok = false;
  }
  error.clear();
  if (!guardrails::CompileOutputRules(config.output_rules, compiled.output, error)) {
    AddIssue(issues, "output_rules", error);
    ok = false;
  }
  return ok;
}

std::string FormatIssues(const std::vector<ConfigIssue>& issues) {
  std::ostringstream out;
  for (const auto& issue : issues) {
    out << issue.path << ": " << issue.message << "\n";
  }
  return out.str();
}

} // namespace researchguard::config
