#pragma once

#include "agents/collaborators.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::backends::scripted {

// One scripted reply, addressed by turn index (its position in the script).
//
// - `fail_attempts`: the first N generation attempts for this turn fail, to
//   exercise retry and exhaustion.
// - `delay`: simulated latency, interruptible by the cancellation token.
struct ScriptedTurn {
  agents::AgentRole role = agents::AgentRole::kPlanner;
  std::string content;
  std::vector<agents::ToolRequest> tool_requests;
  std::uint32_t fail_attempts = 0;
  std::chrono::milliseconds delay{0};
};

// Parses `{"turns":[{"role":..., "content":..., "tool_requests":[...],
// "fail_attempts":N, "delay_ms":N}, ...]}`.
bool LoadScriptText(std::string_view text, std::vector<ScriptedTurn>& turns, std::string& error);
bool LoadScriptFile(const std::filesystem::path& path, std::vector<ScriptedTurn>& turns,
                    std::string& error);

// Deterministic, network-free generator that replays a fixed conversation.
//
// The reply for a request is the script entry at the request's transcript
// length, so retries of the same turn always see the same entry. A request
// whose role does not match its entry, or that runs past the end of the
// script, fails without retry success. Failure budgets reset when a request
// starts a new conversation, so one generator can serve several queries.
class ScriptedGenerator final : public agents::IGenerator {
public:
  explicit ScriptedGenerator(std::vector<ScriptedTurn> turns);

  bool Generate(const agents::GenerationRequest& request, const core::CancellationToken& cancel,
                agents::GenerationReply& reply, std::string& error) override;

  // Total Generate calls, failed ones included.
  std::size_t CallCount() const;
  // Directive received by the most recent call.
  std::string LastDirective() const;

private:
  std::vector<ScriptedTurn> turns_;

  mutable std::mutex mu_;
  std::map<std::size_t, std::uint32_t> failures_used_;
  std::optional<std::size_t> last_turn_index_;
  bool last_call_succeeded_ = false;
  std::size_t call_count_ = 0;
  std::string last_directive_;
};

} // namespace researchguard::backends::scripted
