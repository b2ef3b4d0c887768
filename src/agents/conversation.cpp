#include "agents/conversation.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace researchguard::agents {

const char* ToString(TerminationReason reason) {
  switch (reason) {
  case TerminationReason::kToken:
    return "token";
  case TerminationReason::kRoundLimit:
    return "round_limit";
  case TerminationReason::kInputBlocked:
    return "input_blocked";
  case TerminationReason::kTimeout:
    return "timeout";
  case TerminationReason::kGenerationFailed:
    return "generation_failed";
  }

  return "round_limit";
}

const char* ToString(QueryStatus status) {
  switch (status) {
  case QueryStatus::kCompleted:
    return "completed";
  case QueryStatus::kBlocked:
    return "blocked";
  case QueryStatus::kTimeout:
    return "timeout";
  case QueryStatus::kGenerationFailed:
    return "generation_failed";
  }

  return "completed";
}

std::string ToJson(const ToolInvocation& invocation) {
  std::ostringstream out;
  out << "{"
      << "\"tool\":\"" << ToString(invocation.capability) << "\","
      << "\"query\":" << core::QuoteJson(invocation.query) << ",";
  if (invocation.year_from.has_value()) {
    out << "\"year_from\":" << invocation.year_from.value() << ",";
  }
  if (invocation.year_to.has_value()) {
    out << "\"year_to\":" << invocation.year_to.value() << ",";
  }
  if (invocation.min_citations > 0U) {
    out << "\"min_citations\":" << invocation.min_citations << ",";
  }
  out << "\"succeeded\":" << (invocation.succeeded ? "true" : "false") << ","
      << "\"output\":" << core::QuoteJson(invocation.output);
  if (!invocation.error.empty()) {
    out << ",\"error\":" << core::QuoteJson(invocation.error);
  }
  out << "}";
  return out.str();
}

std::string ToJson(const ConversationTurn& turn) {
  std::ostringstream out;
  out << "{"
      << "\"index\":" << turn.index << ","
      << "\"role\":\"" << ToString(turn.role) << "\","
      << "\"timestamp\":\"" << core::FormatUtcTimestamp(turn.ts) << "\","
      << "\"content\":" << core::QuoteJson(turn.content) << ","
      << "\"tool_invocations\":[";
  for (std::size_t i = 0; i < turn.tool_invocations.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << ToJson(turn.tool_invocations[i]);
  }
  out << "]}";
  return out.str();
}

std::string ToJson(const QueryResult& result) {
  std::ostringstream out;
  out << "{\n"
      << "  \"query\": " << core::QuoteJson(result.query) << ",\n"
      << "  \"status\": \"" << ToString(result.status) << "\",\n"
      << "  \"response\": " << core::QuoteJson(result.response) << ",\n";
  if (result.termination_reason.has_value()) {
    out << "  \"termination_reason\": \"" << ToString(result.termination_reason.value())
        << "\",\n";
  } else {
    out << "  \"termination_reason\": null,\n";
  }
  if (!result.error.empty()) {
    out << "  \"error\": " << core::QuoteJson(result.error) << ",\n";
  }
  out << "  \"citations\": " << core::ToJsonStringArray(result.citations) << ",\n"
      << "  \"conversation_history\": [";
  for (std::size_t i = 0; i < result.conversation_history.size(); ++i) {
    out << (i == 0U ? "\n    " : ",\n    ") << ToJson(result.conversation_history[i]);
  }
  out << (result.conversation_history.empty() ? "],\n" : "\n  ],\n");

  const QueryMetadata& metadata = result.metadata;
  out << "  \"metadata\": {\n"
      << "    \"blocked\": " << (metadata.blocked ? "true" : "false") << ",\n"
      << "    \"safety_check_passed\": " << (metadata.safety_check_passed ? "true" : "false")
      << ",\n"
      << "    \"num_messages\": " << metadata.num_messages << ",\n"
      << "    \"num_sources\": " << metadata.num_sources << ",\n"
      << "    \"input_advisory\": " << core::QuoteJson(metadata.input_advisory) << ",\n"
      << "    \"safety_violations\": " << guardrails::ToJson(metadata.safety_violations) << "\n"
      << "  }\n"
      << "}";
  return out.str();
}

} // namespace researchguard::agents
