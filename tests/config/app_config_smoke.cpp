#include "common/assertions.hpp"
#include "config/app_config.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace {

using researchguard::config::AppConfig;
using researchguard::config::ConfigIssue;
using researchguard::tests::common::AssertContains;
using researchguard::tests::common::Fail;

std::string Issues(const std::vector<ConfigIssue>& issues) {
  return researchguard::config::FormatIssues(issues);
}

} // namespace

int main() {
  using researchguard::config::LoadAppConfigFile;
  using researchguard::config::LoadAppConfigText;

  {
    AppConfig config;
    std::vector<ConfigIssue> issues;
    if (!LoadAppConfigText("{}", config, issues)) {
      Fail("empty config should load with defaults:\n" + Issues(issues));
    }
    if (!config.safety.enabled || !config.safety.log_events ||
        config.safety.action != researchguard::safety::ViolationAction::kRefuse ||
        config.audit_log != researchguard::config::kDefaultAuditLogPath ||
        config.conversation.termination.max_rounds != 3U ||
        config.conversation.termination.termination_token != "TERMINATE" ||
        config.conversation.max_citations != 10U ||
        config.conversation.retry.max_attempts != 3U ||
        config.input_rules.max_length != 2000U ||
        config.output_rules.pii_patterns.size() != 4U) {
      Fail("defaults do not match the built-in policy");
    }
  }

  {
    const std::filesystem::path sample =
        std::filesystem::path(RESEARCHGUARD_SOURCE_DIR) / "config" / "researchguard.json";
    AppConfig config;
    std::vector<ConfigIssue> issues;
    if (!LoadAppConfigFile(sample, config, issues)) {
      Fail("shipped config should load:\n" + Issues(issues));
    }
    if (config.conversation.request_timeout != std::chrono::milliseconds(60000)) {
      Fail("request timeout should be read from the shipped config");
    }
    AssertContains(config.conversation.directives.Get(researchguard::agents::AgentRole::kWriter),
                   "cites its sources");
  }

  {
    AppConfig config;
    std::vector<ConfigIssue> issues;
    const std::string text = R"({
      "safety": {"enabled": false, "audit_log": "", "on_violation": {"action": "sanitize"}},
      "input_rules": {"enforce_topic_relevance": true, "toxic_lexicon": ["blorp"]},
      "output_rules": {"redaction_token": "<pii>", "pii_patterns": {"ticket": "TCK-\\d+"}},
      "conversation": {"max_rounds": 5, "termination_token": "DONE", "request_timeout_ms": 2500,
                       "initial_backoff_ms": 50, "max_tool_calls_per_turn": 1},
      "agents": {"critic": {"directive": "Say DONE when satisfied."}},
      "logging": {"level": "debug"}
    })";
    if (!LoadAppConfigText(text, config, issues)) {
      Fail("override config should load:\n" + Issues(issues));
    }
    if (config.safety.enabled || !config.audit_log.empty() ||
        config.safety.action != researchguard::safety::ViolationAction::kSanitize) {
      Fail("safety overrides not applied");
    }
    if (!config.input_rules.enforce_topic_relevance || config.input_rules.toxic_lexicon.size() != 1U) {
      Fail("input rule overrides not applied");
    }
    if (config.output_rules.pii_patterns.size() != 1U ||
        config.output_rules.pii_patterns[0].type != "ticket" ||
        config.output_rules.redaction_token != "<pii>") {
      Fail("pii pattern object form not applied");
    }
    if (config.conversation.termination.max_rounds != 5U ||
        config.conversation.termination.termination_token != "DONE" ||
        config.conversation.request_timeout != std::chrono::milliseconds(2500) ||
        config.conversation.retry.initial_backoff != std::chrono::milliseconds(50) ||
        config.conversation.max_tool_calls_per_turn != 1U) {
      Fail("conversation overrides not applied");
    }
    if (config.conversation.directives.Get(researchguard::agents::AgentRole::kCritic) !=
        "Say DONE when satisfied.") {
      Fail("directive override not applied");
    }
    if (config.log_level != researchguard::core::logging::LogLevel::kDebug) {
      Fail("log level override not applied");
    }
  }

  {
    // Every problem is reported, each with its path.
    AppConfig config;
    config.conversation.termination.max_rounds = 7;
    std::vector<ConfigIssue> issues;
    const std::string text = R"({
      "safety": {"enabled": "yes", "on_violation": {"action": "ignore"}},
      "input_rules": {"max_length": -1, "unknown_rule": true},
      "conversation": {"max_rounds": 0},
      "agents": {"moderator": {"directive": "x"}},
      "telemetry": {}
    })";
    if (LoadAppConfigText(text, config, issues)) {
      Fail("invalid config should be rejected");
    }
    const std::string report = Issues(issues);
    AssertContains(report, "safety.enabled: must be a boolean");
    AssertContains(report, "safety.on_violation.action: must be one of refuse|sanitize");
    AssertContains(report, "input_rules.max_length: must be a non-negative integer");
    AssertContains(report, "input_rules.unknown_rule: is not a recognized field");
    AssertContains(report, "conversation.max_rounds: must be >= 1");
    AssertContains(report, "agents.moderator: is not a known role");
    AssertContains(report, "telemetry: is not a recognized field");
    if (config.conversation.termination.max_rounds != 7U) {
      Fail("a rejected config must leave the output untouched");
    }
  }

  {
    AppConfig config;
    std::vector<ConfigIssue> issues;
    if (LoadAppConfigText(R"({"input_rules": {"injection_patterns": ["(broken"]}})", config,
                          issues)) {
      Fail("uncompilable patterns should fail validation");
    }
    AssertContains(Issues(issues), "injection_patterns");
  }

  {
    AppConfig config;
    std::vector<ConfigIssue> issues;
    if (LoadAppConfigText("{\"safety\": ", config, issues) || issues.empty() ||
        issues.front().path != "$") {
      Fail("parse errors should be reported under $");
    }
    if (LoadAppConfigFile("/nonexistent/researchguard.json", config, issues) ||
        issues.front().path != "$") {
      Fail("missing file should be reported under $");
    }
  }

  std::cout << "app_config_smoke: ok\n";
  return 0;
}
