#pragma once

#include "agents/conversation.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::agents {

inline constexpr const char* kDefaultTerminationToken = "TERMINATE";

struct TerminationConfig {
  std::size_t max_rounds = 3;
  std::string termination_token = kDefaultTerminationToken;
};

// Result of checking the transcript after a committed turn.
struct TerminationDecision {
  bool should_stop = false;
  TerminationReason reason = TerminationReason::kRoundLimit;
  std::string explanation;
};

// Case-sensitive substring test. An empty token never matches.
bool ContainsTerminationToken(std::string_view content, std::string_view token);

// Removes every occurrence of `token` and trims surrounding whitespace.
std::string StripTerminationToken(std::string_view content, std::string_view token);

// Evaluated after every committed turn, in priority order:
// 1) the last turn mentions the termination token
// 2) `max_rounds` full cycles of all roles have been committed
//
// Contract:
// - true: `decision` is valid and `error` is empty.
// - false: config is invalid (zero rounds); `error` explains why.
bool EvaluateTermination(const TerminationConfig& config,
                         const std::vector<ConversationTurn>& transcript,
                         TerminationDecision& decision,
                         std::string& error);

// Text handed to the output gate once the conversation stops: the most
// recent Writer turn, otherwise the last turn. The token is stripped either
// way. Empty when the transcript is empty.
std::string SelectCandidateResponse(const std::vector<ConversationTurn>& transcript,
                                    std::string_view token);

} // namespace researchguard::agents
