#include "agents/coordinator.hpp"

#include "agents/citations.hpp"

#include <string>
#include <utility>

namespace researchguard::agents {

namespace {

// Clears the busy flag when a call leaves ProcessQuery by any path.
class BusyGuard {
public:
  explicit BusyGuard(std::atomic<bool>& busy) : busy_(busy) {}
  ~BusyGuard() {
    busy_.store(false, std::memory_order_release);
  }

  BusyGuard(const BusyGuard&) = delete;
  BusyGuard& operator=(const BusyGuard&) = delete;

private:
  std::atomic<bool>& busy_;
};

const char* NoResultsFragment(Capability capability) {
  return capability == Capability::kPaperSearch ? kNoPaperResults : kNoWebResults;
}

// Tool results are folded into the turn text so later roles read them as part
// of the conversation. Failed calls contribute their no-results fragment.
void AppendToolResults(ConversationTurn& turn) {
  for (const auto& invocation : turn.tool_invocations) {
    turn.content += "\n\n[" + std::string(ToString(invocation.capability)) + ": " +
                    invocation.query + "]\n" + invocation.output;
  }
}

} // namespace

ConversationCoordinator::ConversationCoordinator(CoordinatorConfig config,
                                                 safety::SafetyManager& safety,
                                                 IGenerator& generator, IResearchTools& tools,
                                                 core::logging::Logger& logger)
    : config_(std::move(config)),
      safety_(safety),
      generator_(generator),
      tools_(tools),
      logger_(logger) {}

bool ConversationCoordinator::ProcessQuery(std::string_view query, QueryResult& result,
                                           std::string& error) {
  if (config_.request_timeout.count() > 0) {
    const core::CancellationToken cancel(config_.request_timeout);
    return ProcessQuery(query, cancel, result, error);
  }
  const core::CancellationToken cancel;
  return ProcessQuery(query, cancel, result, error);
}

bool ConversationCoordinator::ProcessQuery(std::string_view query,
                                           const core::CancellationToken& cancel,
                                           QueryResult& result, std::string& error) {
  if (busy_.exchange(true, std::memory_order_acq_rel)) {
    error = "coordinator is already processing a query";
    return false;
  }
  BusyGuard guard(busy_);

  if (config_.termination.max_rounds == 0U) {
    error = "max_rounds must be greater than 0";
    return false;
  }

  result = QueryResult{};
  result.query = std::string(query);
  ConversationState state;

  // Input gate. Nothing is generated for a blocked query.
  safety::InputCheck input_check = safety_.CheckInput(query);
  if (!input_check.safe) {
    logger_.Warn("query blocked by input gate",
                 {{"violations", std::to_string(input_check.violations.size())}});
    result.response = input_check.user_message;
    result.metadata.blocked = true;
    result.metadata.safety_check_passed = false;
    result.metadata.safety_violations = std::move(input_check.violations);
    Finish(state, TerminationReason::kInputBlocked, QueryStatus::kBlocked, result);
    return true;
  }
  result.metadata.input_advisory = input_check.user_message;
  result.metadata.safety_violations = std::move(input_check.violations);

  logger_.Info("conversation started",
               {{"max_rounds", std::to_string(config_.termination.max_rounds)},
                {"timeout_ms", std::to_string(config_.request_timeout.count())}});

  const std::string query_text(query);
  for (std::size_t turn_index = 0;; ++turn_index) {
    if (cancel.ShouldStop()) {
      result.error = "deadline reached after " + std::to_string(state.transcript.size()) +
                     " committed turns";
      Finish(state, TerminationReason::kTimeout, QueryStatus::kTimeout, result);
      return true;
    }

    std::string turn_error;
    const TurnOutcome outcome = RunTurn(turn_index, query_text, cancel, state, turn_error);
    if (outcome == TurnOutcome::kCancelled) {
      result.error = turn_error.empty() ? "deadline reached during turn " +
                                              std::to_string(turn_index)
                                        : turn_error;
      Finish(state, TerminationReason::kTimeout, QueryStatus::kTimeout, result);
      return true;
    }
    if (outcome == TurnOutcome::kGenerationFailed) {
      result.error = std::move(turn_error);
      Finish(state, TerminationReason::kGenerationFailed, QueryStatus::kGenerationFailed,
             result);
      return true;
    }

    TerminationDecision decision;
    std::string termination_error;
    if (!EvaluateTermination(config_.termination, state.transcript, decision,
                             termination_error)) {
      error = termination_error;
      return false;
    }
    if (decision.should_stop) {
      logger_.Info("conversation terminated", {{"reason", ToString(decision.reason)},
                                               {"detail", decision.explanation}});
      Finish(state, decision.reason, QueryStatus::kCompleted, result);
      break;
    }
  }

  // Output gate.
  const std::string candidate =
      SelectCandidateResponse(result.conversation_history, config_.termination.termination_token);
  safety::OutputCheck output_check = safety_.CheckOutput(candidate);
  result.response = std::move(output_check.final_response);
  result.metadata.safety_check_passed = output_check.safe;
  for (auto& violation : output_check.violations) {
    result.metadata.safety_violations.push_back(std::move(violation));
  }
  if (!output_check.safe) {
    logger_.Warn("response withheld or sanitized by output gate",
                 {{"action", ToString(safety_.Config().action)}});
  }
  return true;
}

ConversationCoordinator::TurnOutcome ConversationCoordinator::RunTurn(
    std::size_t turn_index, const std::string& query, const core::CancellationToken& cancel,
    ConversationState& state, std::string& error) {
  const AgentRole role = RoleForTurn(turn_index);
  state.round_index = turn_index / kRoleCount;

  GenerationRequest request;
  request.role = role;
  request.directive = config_.directives.Get(role);
  request.query = query;
  request.transcript = &state.transcript;

  logger_.Debug("turn started", {{"turn", std::to_string(turn_index)},
                                 {"role", ToString(role)},
                                 {"round", std::to_string(state.round_index)}});

  GenerationAttemptResult attempt =
      ExecuteGenerationAttempts(generator_, request, config_.retry, cancel, logger_);
  if (attempt.outcome == GenerationOutcome::kCancelled) {
    error = "deadline reached while generating turn " + std::to_string(turn_index) + " (" +
            ToString(role) + ")";
    return TurnOutcome::kCancelled;
  }
  if (attempt.outcome == GenerationOutcome::kExhausted) {
    error = std::string(ToString(role)) + " generation failed after " +
            std::to_string(attempt.attempts_used) + " attempts: " + attempt.error;
    logger_.Error("generation attempts exhausted",
                  {{"turn", std::to_string(turn_index)},
                   {"role", ToString(role)},
                   {"error", attempt.error}});
    return TurnOutcome::kGenerationFailed;
  }

  ConversationTurn turn;
  turn.index = turn_index;
  turn.role = role;
  turn.content = std::move(attempt.reply.content);
  if (!ExecuteToolRequests(role, attempt.reply.tool_requests, cancel, turn.tool_invocations)) {
    error = "deadline reached during tool calls of turn " + std::to_string(turn_index);
    return TurnOutcome::kCancelled;
  }
  AppendToolResults(turn);
  turn.ts = std::chrono::system_clock::now();

  logger_.Debug("turn committed", {{"turn", std::to_string(turn_index)},
                                   {"role", ToString(role)},
                                   {"tool_calls", std::to_string(turn.tool_invocations.size())}});
  state.transcript.push_back(std::move(turn));
  return TurnOutcome::kCommitted;
}

bool ConversationCoordinator::ExecuteToolRequests(AgentRole role,
                                                  const std::vector<ToolRequest>& requests,
                                                  const core::CancellationToken& cancel,
                                                  std::vector<ToolInvocation>& invocations) {
  for (const auto& request : requests) {
    if (!HasCapability(role, request.capability)) {
      logger_.Warn("dropping tool request from role without capability",
                   {{"role", ToString(role)}, {"tool", ToString(request.capability)}});
      continue;
    }
    if (invocations.size() >= config_.max_tool_calls_per_turn) {
      logger_.Warn("dropping tool request over per-turn limit",
                   {{"role", ToString(role)},
                    {"tool", ToString(request.capability)},
                    {"limit", std::to_string(config_.max_tool_calls_per_turn)}});
      continue;
    }
    if (cancel.ShouldStop()) {
      return false;
    }

    ToolInvocation invocation;
    invocation.capability = request.capability;
    invocation.query = request.query;
    invocation.year_from = request.year_from;
    invocation.year_to = request.year_to;
    invocation.min_citations = request.min_citations;

    std::string output;
    std::string tool_error;
    bool ok = false;
    if (request.capability == Capability::kPaperSearch) {
      const PaperFilter filter{.year_from = request.year_from,
                               .year_to = request.year_to,
                               .min_citations = request.min_citations};
      ok = tools_.PaperSearch(request.query, filter, cancel, output, tool_error);
    } else {
      ok = tools_.WebSearch(request.query, cancel, output, tool_error);
    }

    if (ok) {
      invocation.succeeded = true;
      invocation.output = std::move(output);
    } else {
      // Tool failures never end the conversation.
      invocation.output = NoResultsFragment(request.capability);
      invocation.error = tool_error.empty() ? "tool returned no output" : tool_error;
      logger_.Warn("tool invocation failed", {{"tool", ToString(request.capability)},
                                              {"error", invocation.error}});
    }
    invocations.push_back(std::move(invocation));
  }
  return true;
}

void ConversationCoordinator::Finish(ConversationState& state, TerminationReason reason,
                                     QueryStatus status, QueryResult& result) {
  state.terminated = true;
  state.termination_reason = reason;

  result.status = status;
  result.termination_reason = reason;
  result.citations = ExtractCitations(state.transcript, config_.max_citations);
  result.metadata.num_messages = state.transcript.size();
  result.metadata.num_sources = result.citations.size();
  result.conversation_history = std::move(state.transcript);
  state.transcript.clear();
}

} // namespace researchguard::agents
