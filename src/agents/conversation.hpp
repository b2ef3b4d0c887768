#pragma once

#include "agents/roles.hpp"
#include "guardrails/violation.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::agents {

// One tool call made during a Researcher turn. A failed call keeps the
// "no results" fragment in `output` and the cause in `error`.
struct ToolInvocation {
  Capability capability = Capability::kWebSearch;
  std::string query;
  std::optional<int> year_from;
  std::optional<int> year_to;
  std::uint32_t min_citations = 0;
  bool succeeded = false;
  std::string output;
  std::string error;
};

// A committed turn. Turns are appended only after generation and tool calls
// for that turn finished, so a partial transcript never holds a torn turn.
struct ConversationTurn {
  std::size_t index = 0;
  AgentRole role = AgentRole::kPlanner;
  std::string content;
  std::vector<ToolInvocation> tool_invocations;
  std::chrono::system_clock::time_point ts{};
};

enum class TerminationReason {
  kToken,
  kRoundLimit,
  kInputBlocked,
  kTimeout,
  kGenerationFailed,
};

// Lives for exactly one ProcessQuery call.
struct ConversationState {
  std::vector<ConversationTurn> transcript;
  std::size_t round_index = 0;
  bool terminated = false;
  std::optional<TerminationReason> termination_reason;
};

enum class QueryStatus {
  kCompleted,
  kBlocked,
  kTimeout,
  kGenerationFailed,
};

struct QueryMetadata {
  bool blocked = false;
  std::vector<guardrails::Violation> safety_violations;
  std::size_t num_messages = 0;
  std::size_t num_sources = 0;
  bool safety_check_passed = true;
  // Advisory note for low/medium input findings; empty otherwise.
  std::string input_advisory;
};

struct QueryResult {
  std::string query;
  QueryStatus status = QueryStatus::kCompleted;
  std::string response;
  std::vector<ConversationTurn> conversation_history;
  std::vector<std::string> citations;
  std::optional<TerminationReason> termination_reason;
  std::string error;
  QueryMetadata metadata;
};

const char* ToString(TerminationReason reason);
const char* ToString(QueryStatus status);

std::string ToJson(const ToolInvocation& invocation);
std::string ToJson(const ConversationTurn& turn);

// Canonical `result.json` payload.
std::string ToJson(const QueryResult& result);

} // namespace researchguard::agents
