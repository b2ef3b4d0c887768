#pragma once

#include "agents/citations.hpp"
#include "agents/collaborators.hpp"
#include "agents/conversation.hpp"
#include "agents/generation_retry.hpp"
#include "agents/roles.hpp"
#include "agents/termination.hpp"
#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "safety/safety_manager.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace researchguard::agents {

struct CoordinatorConfig {
  TerminationConfig termination;
  std::size_t max_citations = kDefaultMaxCitations;
  RetryPolicy retry;
  // 0 disables the per-query deadline.
  std::chrono::milliseconds request_timeout{0};
  std::size_t max_tool_calls_per_turn = 2;
  RoleDirectives directives;
};

// Drives Planner, Researcher, Writer and Critic through ordered turns for one
// query at a time, with both safety gates around the exchange.
//
// Lifecycle per call: Idle -> Running -> Terminated. Turns run strictly
// sequentially; only Researcher turns may execute tools. A turn is appended
// to the transcript only after its generation and tool calls completed, so
// timeout and generation-failure results always carry whole turns.
//
// Collaborators are borrowed and must outlive the coordinator. One instance
// serves one query at a time; independent instances may share the
// SafetyManager and the logger.
class ConversationCoordinator {
public:
  ConversationCoordinator(CoordinatorConfig config, safety::SafetyManager& safety,
                          IGenerator& generator, IResearchTools& tools,
                          core::logging::Logger& logger);

  ConversationCoordinator(const ConversationCoordinator&) = delete;
  ConversationCoordinator& operator=(const ConversationCoordinator&) = delete;

  // Processes `query` under the configured request timeout.
  //
  // Contract:
  // - true: `result` is populated. Blocked, timed-out and generation-failed
  //   conversations are results, not errors; see `result.status`.
  // - false: the call could not start (invalid config, or another call is
  //   already running on this instance); `error` explains why.
  bool ProcessQuery(std::string_view query, QueryResult& result, std::string& error);

  // Same, but bounded by a caller-owned token so the caller can cancel from
  // another thread or impose its own deadline.
  bool ProcessQuery(std::string_view query, const core::CancellationToken& cancel,
                    QueryResult& result, std::string& error);

  const CoordinatorConfig& Config() const {
    return config_;
  }

private:
  enum class TurnOutcome {
    kCommitted,
    kCancelled,
    kGenerationFailed,
  };

  TurnOutcome RunTurn(std::size_t turn_index, const std::string& query,
                      const core::CancellationToken& cancel, ConversationState& state,
                      std::string& error);
  bool ExecuteToolRequests(AgentRole role, const std::vector<ToolRequest>& requests,
                           const core::CancellationToken& cancel,
                           std::vector<ToolInvocation>& invocations);
  void Finish(ConversationState& state, TerminationReason reason, QueryStatus status,
              QueryResult& result);

  CoordinatorConfig config_;
  safety::SafetyManager& safety_;
  IGenerator& generator_;
  IResearchTools& tools_;
  core::logging::Logger& logger_;
  std::atomic<bool> busy_{false};
};

} // namespace researchguard::agents
