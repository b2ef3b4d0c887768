#include "agents/termination.hpp"

#include <cctype>
#include <utility>

namespace researchguard::agents {

namespace {

std::string TrimAsciiWhitespace(std::string value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(begin, end - begin);
}

} // namespace

bool ContainsTerminationToken(std::string_view content, std::string_view token) {
  if (token.empty()) {
    return false;
  }
  return content.find(token) != std::string_view::npos;
}

std::string StripTerminationToken(std::string_view content, std::string_view token) {
  std::string stripped(content);
  if (!token.empty()) {
    std::size_t pos = stripped.find(token);
    while (pos != std::string::npos) {
      stripped.erase(pos, token.size());
      pos = stripped.find(token, pos);
    }
  }
  return TrimAsciiWhitespace(std::move(stripped));
}

bool EvaluateTermination(const TerminationConfig& config,
                         const std::vector<ConversationTurn>& transcript,
                         TerminationDecision& decision,
                         std::string& error) {
  decision = TerminationDecision{};
  error.clear();

  if (config.max_rounds == 0U) {
    error = "max_rounds must be greater than 0";
    return false;
  }
  if (transcript.empty()) {
    return true;
  }

  const ConversationTurn& last = transcript.back();
  if (ContainsTerminationToken(last.content, config.termination_token)) {
    decision.should_stop = true;
    decision.reason = TerminationReason::kToken;
    decision.explanation = std::string(ToString(last.role)) + " turn " +
                           std::to_string(last.index) + " mentioned the termination token";
    return true;
  }

  const std::size_t turn_limit = config.max_rounds * kRoleCount;
  if (transcript.size() >= turn_limit) {
    decision.should_stop = true;
    decision.reason = TerminationReason::kRoundLimit;
    decision.explanation = "completed " + std::to_string(config.max_rounds) + " rounds";
  }
  return true;
}

std::string SelectCandidateResponse(const std::vector<ConversationTurn>& transcript,
                                    std::string_view token) {
  for (auto it = transcript.rbegin(); it != transcript.rend(); ++it) {
    if (it->role == AgentRole::kWriter) {
      return StripTerminationToken(it->content, token);
    }
  }
  if (transcript.empty()) {
    return "";
  }
  return StripTerminationToken(transcript.back().content, token);
}

} // namespace researchguard::agents
