#include "researchguard/cli/router.hpp"

#include "agents/coordinator.hpp"
#include "artifacts/result_writer.hpp"
#include "backends/scripted/scripted_generator.hpp"
#include "config/app_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "events/audit_sink.hpp"
#include "guardrails/input_guardrail.hpp"
#include "guardrails/output_guardrail.hpp"
#include "safety/safety_manager.hpp"
#include "tools/research_tools.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace researchguard::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitBlocked = core::errors::ToInt(core::errors::ExitCode::kBlocked);
constexpr int kExitTimedOut = core::errors::ToInt(core::errors::ExitCode::kTimedOut);
constexpr int kExitGenerationFailed =
    core::errors::ToInt(core::errors::ExitCode::kGenerationFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  researchguard check-input <text> [--config <file>] [--audit-log <file>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  researchguard check-output <text> [--config <file>] [--audit-log <file>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  researchguard ask <query> --script <script.json> [--corpus <corpus.json>] "
         "[--config <file>] [--audit-log <file>] [--out <dir>] [--timeout-ms <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  researchguard stats --audit-log <file>\n"
      << "  researchguard validate-config <file>\n"
      << "  researchguard version\n";
}

std::string MakeQueryId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "query-" + std::to_string(millis);
}

void PrintIssues(const fs::path& config_path, const std::vector<config::ConfigIssue>& issues) {
  std::cerr << "invalid config: " << (config_path.empty() ? "(built-in)" : config_path.string())
            << '\n';
  for (const auto& issue : issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Built-in defaults when no config path is given.
bool LoadConfigOrDefault(const fs::path& config_path, config::AppConfig& app_config,
                         std::vector<config::ConfigIssue>& issues) {
  if (config_path.empty()) {
    app_config = config::AppConfig{};
    issues.clear();
    return true;
  }
  return config::LoadAppConfigFile(config_path, app_config, issues);
}

std::unique_ptr<safety::SafetyManager> BuildSafetyManager(
    const config::AppConfig& app_config, const std::optional<fs::path>& audit_log_override,
    core::logging::Logger& logger, std::vector<config::ConfigIssue>& issues) {
  config::CompiledRules compiled;
  if (!config::CompileRules(app_config, compiled, issues)) {
    return nullptr;
  }

  std::shared_ptr<events::IAuditSink> sink;
  const fs::path audit_log =
      audit_log_override.has_value() ? audit_log_override.value() : fs::path(app_config.audit_log);
  if (!audit_log.empty()) {
    sink = std::make_shared<events::JsonlAuditSink>(audit_log);
  }

  return std::make_unique<safety::SafetyManager>(
      app_config.safety, guardrails::InputGuardrail(std::move(compiled.input)),
      guardrails::OutputGuardrail(std::move(compiled.output)), std::move(sink), logger);
}

struct CheckOptions {
  std::string text;
  fs::path config_path;
  std::optional<fs::path> audit_log_path;
  std::optional<core::logging::LogLevel> log_level;
};

bool ParseLogLevelValue(std::string_view raw, std::optional<core::logging::LogLevel>& out,
                        std::string& error) {
  core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
  if (!core::logging::ParseLogLevel(raw, parsed, error)) {
    return false;
  }
  out = parsed;
  return true;
}

// Parse `check-input` / `check-output` args:
// - exactly one text argument
// - optional `--config`, `--audit-log`, `--log-level`
bool ParseCheckOptions(std::string_view command, const std::vector<std::string_view>& args,
                       CheckOptions& options, std::string& error) {
  bool have_text = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--config" || token == "--audit-log" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[++i];
      if (token == "--config") {
        options.config_path = fs::path(value);
      } else if (token == "--audit-log") {
        options.audit_log_path = fs::path(value);
      } else if (!ParseLogLevelValue(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (token.size() > 1 && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (have_text) {
      error = std::string(command) + " accepts exactly 1 text argument";
      return false;
    }
    options.text = std::string(token);
    have_text = true;
  }

  if (!have_text) {
    error = std::string(command) + " requires exactly 1 argument: <text>";
    return false;
  }
  return true;
}

int CommandCheck(std::string_view command, const std::vector<std::string_view>& args) {
  CheckOptions options;
  std::string error;
  if (!ParseCheckOptions(command, args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::AppConfig app_config;
  std::vector<config::ConfigIssue> issues;
  if (!LoadConfigOrDefault(options.config_path, app_config, issues)) {
    PrintIssues(options.config_path, issues);
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(options.log_level.value_or(app_config.log_level));
  std::unique_ptr<safety::SafetyManager> safety_manager =
      BuildSafetyManager(app_config, options.audit_log_path, logger, issues);
  if (safety_manager == nullptr) {
    PrintIssues(options.config_path, issues);
    return kExitConfigInvalid;
  }

  bool safe = true;
  if (command == "check-input") {
    const safety::InputCheck check = safety_manager->CheckInput(options.text);
    safe = check.safe;
    std::cout << "{\"safe\":" << (check.safe ? "true" : "false")
              << ",\"violations\":" << guardrails::ToJson(check.violations)
              << ",\"message\":" << core::QuoteJson(check.user_message) << "}\n";
  } else {
    const safety::OutputCheck check = safety_manager->CheckOutput(options.text);
    safe = check.safe;
    std::cout << "{\"safe\":" << (check.safe ? "true" : "false")
              << ",\"violations\":" << guardrails::ToJson(check.violations)
              << ",\"response\":" << core::QuoteJson(check.final_response) << "}\n";
  }
  return safe ? kExitSuccess : kExitBlocked;
}

bool ParseTimeoutMs(std::string_view raw, std::chrono::milliseconds& timeout,
                    std::string& error) {
  std::uint64_t parsed = 0;
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || end != raw.data() + raw.size()) {
    error = "--timeout-ms must be a non-negative integer";
    return false;
  }
  timeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(parsed));
  return true;
}

// Parse `ask` args with an explicit contract:
// - exactly one query
// - required `--script <file>`
// Unknown flags or duplicate positional args are usage errors.
bool ParseAskOptions(const std::vector<std::string_view>& args, AskOptions& options,
                     std::string& error) {
  bool have_query = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool takes_value = token == "--script" || token == "--corpus" ||
                             token == "--config" || token == "--audit-log" ||
                             token == "--out" || token == "--timeout-ms" ||
                             token == "--log-level";
    if (takes_value) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[++i];
      if (token == "--script") {
        options.script_path = fs::path(value);
      } else if (token == "--corpus") {
        options.corpus_path = fs::path(value);
      } else if (token == "--config") {
        options.config_path = fs::path(value);
      } else if (token == "--audit-log") {
        options.audit_log_path = fs::path(value);
      } else if (token == "--out") {
        options.output_dir = fs::path(value);
      } else if (token == "--timeout-ms") {
        std::chrono::milliseconds timeout{0};
        if (!ParseTimeoutMs(value, timeout, error)) {
          return false;
        }
        options.timeout = timeout;
      } else if (!ParseLogLevelValue(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (token.size() > 1 && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (have_query) {
      error = "ask accepts exactly 1 query";
      return false;
    }
    options.query = std::string(token);
    have_query = true;
  }

  if (!have_query) {
    error = "ask requires exactly 1 argument: <query>";
    return false;
  }
  if (options.script_path.empty()) {
    error = "ask requires --script <script.json>";
    return false;
  }
  return true;
}

int ExitCodeForStatus(agents::QueryStatus status) {
  switch (status) {
  case agents::QueryStatus::kCompleted:
    return kExitSuccess;
  case agents::QueryStatus::kBlocked:
    return kExitBlocked;
  case agents::QueryStatus::kTimeout:
    return kExitTimedOut;
  case agents::QueryStatus::kGenerationFailed:
    return kExitGenerationFailed;
  }

  return kExitFailure;
}

int CommandAsk(const std::vector<std::string_view>& args) {
  AskOptions options;
  std::string error;
  if (!ParseAskOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteAsk(options, nullptr);
}

int CommandStats(const std::vector<std::string_view>& args) {
  if (args.size() != 2 || args[0] != "--audit-log") {
    std::cerr << "error: stats requires --audit-log <file>\n";
    return kExitUsage;
  }

  std::vector<events::SafetyEvent> events;
  std::string error;
  if (!events::ReadAuditLogJsonl(fs::path(args[1]), events, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << events::ToJson(events::ComputeSafetyStats(events)) << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <file>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  config::AppConfig app_config;
  std::vector<config::ConfigIssue> issues;
  if (!config::LoadAppConfigFile(config_path, app_config, issues)) {
    PrintIssues(config_path, issues);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "researchguard 0.1.0\n";
  return kExitSuccess;
}

} // namespace

int ExecuteAsk(const AskOptions& options, agents::QueryResult* result) {
  config::AppConfig app_config;
  std::vector<config::ConfigIssue> issues;
  if (!LoadConfigOrDefault(options.config_path, app_config, issues)) {
    PrintIssues(options.config_path, issues);
    return kExitConfigInvalid;
  }
  if (options.timeout.has_value()) {
    app_config.conversation.request_timeout = options.timeout.value();
  }

  core::logging::Logger logger(options.log_level.value_or(app_config.log_level));
  logger.SetQueryId(MakeQueryId(std::chrono::system_clock::now()));
  logger.Info("query execution requested", {{"script", options.script_path.string()},
                                            {"corpus", options.corpus_path.string()},
                                            {"config", options.config_path.string()}});

  std::unique_ptr<safety::SafetyManager> safety_manager =
      BuildSafetyManager(app_config, options.audit_log_path, logger, issues);
  if (safety_manager == nullptr) {
    PrintIssues(options.config_path, issues);
    return kExitConfigInvalid;
  }

  std::string error;
  std::vector<backends::scripted::ScriptedTurn> script;
  if (!backends::scripted::LoadScriptFile(options.script_path, script, error)) {
    logger.Error("failed to load generation script", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  tools::FixtureCorpus corpus;
  if (!options.corpus_path.empty() &&
      !tools::LoadFixtureCorpusFile(options.corpus_path, corpus, error)) {
    logger.Error("failed to load research corpus", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  backends::scripted::ScriptedGenerator generator(std::move(script));
  tools::FixtureResearchTools research_tools(std::move(corpus));
  agents::ConversationCoordinator coordinator(app_config.conversation, *safety_manager, generator,
                                              research_tools, logger);

  agents::QueryResult query_result;
  if (!coordinator.ProcessQuery(options.query, query_result, error)) {
    logger.Error("query processing failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (options.output_dir.has_value()) {
    fs::path result_path;
    if (!artifacts::WriteQueryResultJson(query_result, options.output_dir.value(), result_path,
                                         error)) {
      logger.Error("failed to write result.json", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    fs::path report_path;
    if (!artifacts::WriteQueryReportMarkdown(query_result, options.output_dir.value(),
                                             report_path, error)) {
      logger.Error("failed to write report.md", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Info("artifacts written", {{"result", result_path.string()},
                                      {"report", report_path.string()}});
  }

  const events::SafetyStats stats = safety_manager->Stats();
  logger.Info("query finished", {{"status", agents::ToString(query_result.status)},
                                 {"turns", std::to_string(query_result.metadata.num_messages)},
                                 {"safety_events", std::to_string(stats.total_events)}});

  std::cout << artifacts::RenderQueryReportMarkdown(query_result);
  const int exit_code = ExitCodeForStatus(query_result.status);
  if (result != nullptr) {
    *result = std::move(query_result);
  }
  return exit_code;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "check-input" || command == "check-output") {
    return CommandCheck(command, args);
  }

  if (command == "ask") {
    return CommandAsk(args);
  }

  if (command == "stats") {
    return CommandStats(args);
  }

  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace researchguard::cli
