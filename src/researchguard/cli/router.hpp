#pragma once

#include "agents/conversation.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace researchguard::cli {

// Options shared by `researchguard ask` and in-process callers, so both go
// through one pipeline assembly.
struct AskOptions {
  std::string query;
  std::filesystem::path script_path;
  std::filesystem::path corpus_path;
  std::filesystem::path config_path;
  std::optional<std::filesystem::path> audit_log_path;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<core::logging::LogLevel> log_level;
};

// Runs one query end to end: config, guardrails, safety manager, scripted
// generator, fixture tools, coordinator, artifacts. Prints the report to
// stdout and returns the process exit code for the outcome. `result` is
// filled when not null and a conversation actually ran.
int ExecuteAsk(const AskOptions& options, agents::QueryResult* result);

// Routes `researchguard` subcommands and returns process exit codes with a
// stable contract for scripts and CI:
//   0  => success / content safe
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration invalid
//   20 => content blocked by a safety gate
//   30 => query timed out
//   40 => generation failed after retries
int Dispatch(int argc, char** argv);

} // namespace researchguard::cli
