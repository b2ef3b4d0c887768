#pragma once

#include "agents/coordinator.hpp"
#include "core/logging/logger.hpp"
#include "guardrails/rules.hpp"
#include "safety/safety_manager.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::config {

inline constexpr const char* kDefaultAuditLogPath = "logs/safety_events.jsonl";

struct ConfigIssue {
  std::string path;
  std::string message;
};

// Everything the CLI needs to assemble a pipeline. Sections omitted from the
// JSON keep these defaults, which reproduce the built-in rule sets.
struct AppConfig {
  safety::SafetyConfig safety;
  // Empty disables the durable audit file; events stay in memory.
  std::string audit_log = kDefaultAuditLogPath;
  guardrails::InputRules input_rules = guardrails::DefaultInputRules();
  guardrails::OutputRules output_rules = guardrails::DefaultOutputRules();
  agents::CoordinatorConfig conversation;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct CompiledRules {
  guardrails::CompiledInputRules input;
  guardrails::CompiledOutputRules output;
};

// Parses and validates configuration JSON.
//
// Contract:
// - true: `config` holds the merged result and `issues` is empty.
// - false: `config` is untouched and `issues` lists every problem found
//   (path + message). Parse errors are reported under path `$`.
// Regex patterns are compiled as part of validation, so a config that loads
// always compiles.
bool LoadAppConfigText(std::string_view json_text, AppConfig& config,
                       std::vector<ConfigIssue>& issues);

// Reads `path` and delegates to LoadAppConfigText. I/O failures are reported
// as an issue under `$`.
bool LoadAppConfigFile(const std::filesystem::path& path, AppConfig& config,
                       std::vector<ConfigIssue>& issues);

// Compiles both rule sets. Issues name the section that failed.
bool CompileRules(const AppConfig& config, CompiledRules& compiled,
                  std::vector<ConfigIssue>& issues);

// One "path: message" line per issue.
std::string FormatIssues(const std::vector<ConfigIssue>& issues);

} // namespace researchguard::config
