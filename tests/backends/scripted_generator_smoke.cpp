#include "backends/scripted/scripted_generator.hpp"
#include "common/assertions.hpp"

#include <chrono>
#include <string>
#include <vector>

int main() {
  using researchguard::agents::AgentRole;
  using researchguard::agents::Capability;
  using researchguard::agents::ConversationTurn;
  using researchguard::agents::GenerationReply;
  using researchguard::agents::GenerationRequest;
  using researchguard::backends::scripted::LoadScriptText;
  using researchguard::backends::scripted::ScriptedGenerator;
  using researchguard::backends::scripted::ScriptedTurn;
  using researchguard::core::CancellationToken;
  using researchguard::tests::common::AssertContains;
  using researchguard::tests::common::Fail;

  const std::string script_text = R"({
    "turns": [
      {"role": "planner", "content": "plan"},
      {"role": "researcher", "content": "searching",
       "tool_requests": [{"tool": "web_search", "query": "voice ui"},
                         {"tool": "paper_search", "query": "voice", "year_from": 2020,
                          "year_to": 2024, "min_citations": 5}],
       "fail_attempts": 1, "delay_ms": 5}
    ]
  })";

  std::vector<ScriptedTurn> turns;
  std::string error;
  if (!LoadScriptText(script_text, turns, error)) {
    Fail("script should load: " + error);
  }
  if (turns.size() != 2U || turns[1].tool_requests.size() != 2U ||
      turns[1].tool_requests[1].capability != Capability::kPaperSearch ||
      turns[1].tool_requests[1].year_from != 2020 || turns[1].tool_requests[1].year_to != 2024 ||
      turns[1].tool_requests[1].min_citations != 5U || turns[1].fail_attempts != 1U ||
      turns[1].delay != std::chrono::milliseconds(5)) {
    Fail("script fields were not parsed");
  }

  ScriptedGenerator generator(std::move(turns));
  std::vector<ConversationTurn> transcript;
  const CancellationToken cancel;

  GenerationRequest request;
  request.role = AgentRole::kPlanner;
  request.directive = "plan it";
  request.transcript = &transcript;
  GenerationReply reply;
  if (!generator.Generate(request, cancel, reply, error) || reply.content != "plan") {
    Fail("first turn should replay the planner entry");
  }
  if (generator.LastDirective() != "plan it") {
    Fail("directive should be recorded");
  }

  ConversationTurn planner;
  planner.role = AgentRole::kPlanner;
  transcript.push_back(planner);
  request.role = AgentRole::kResearcher;
  if (generator.Generate(request, cancel, reply, error)) {
    Fail("configured failure should fail the first attempt");
  }
  AssertContains(error, "scripted generation failure 1 of 1");
  reply = GenerationReply{};
  if (!generator.Generate(request, cancel, reply, error) || reply.tool_requests.size() != 2U) {
    Fail("retry of the same turn should succeed with tool requests");
  }

  request.role = AgentRole::kPlanner;
  if (generator.Generate(request, cancel, reply, error)) {
    Fail("role mismatch should fail");
  }
  AssertContains(error, "is for role researcher, requested planner");

  transcript.push_back(planner);
  request.role = AgentRole::kWriter;
  if (generator.Generate(request, cancel, reply, error)) {
    Fail("running past the script should fail");
  }
  AssertContains(error, "no entry for turn 2");
  if (generator.CallCount() != 5U) {
    Fail("every call should be counted");
  }

  std::vector<ScriptedTurn> rejected;
  if (LoadScriptText(R"({"turns": []})", rejected, error)) {
    Fail("empty scripts should be rejected");
  }
  if (LoadScriptText(R"({"turns": [{"role": "oracle", "content": "x"}]})", rejected, error)) {
    Fail("unknown roles should be rejected");
  }
  AssertContains(error, "role must be one of");
  if (LoadScriptText(
          R"({"turns": [{"role": "researcher", "content": "x", "tool_requests": [{"tool": "shell", "query": "ls"}]}]})",
          rejected, error)) {
    Fail("unknown tools should be rejected");
  }

  if (LoadScriptText(
          R"({"turns": [{"role": "researcher", "content": "x", "tool_requests": [{"tool": "paper_search", "query": "q", "year_from": 1e12}]}]})",
          rejected, error)) {
    Fail("out-of-range years should be rejected");
  }
  AssertContains(error, "year_from must be an integer in [0, 9999]");
  if (LoadScriptText(R"({"turns": [{"role": "planner", "content": "x", "fail_attempts": 5e9}]})",
                     rejected, error)) {
    Fail("oversized failure counts should be rejected");
  }
  AssertContains(error, "fail_attempts must be an integer");
  if (LoadScriptText(R"({"turns": [{"role": "planner", "content": "x", "delay_ms": -1}]})",
                     rejected, error)) {
    Fail("negative delays should be rejected");
  }
  AssertContains(error, "delay_ms must be an integer");

  {
    // One generator serving two conversations replays the failure for each.
    std::vector<ScriptedTurn> flaky;
    flaky.push_back({.role = AgentRole::kPlanner, .content = "plan", .fail_attempts = 1});
    ScriptedGenerator reused(std::move(flaky));
    std::vector<ConversationTurn> empty;
    GenerationRequest first;
    first.role = AgentRole::kPlanner;
    first.transcript = &empty;
    for (int conversation = 0; conversation < 2; ++conversation) {
      if (reused.Generate(first, cancel, reply, error)) {
        Fail("each conversation should see the scripted failure");
      }
      AssertContains(error, "scripted generation failure 1 of 1");
      if (!reused.Generate(first, cancel, reply, error) || reply.content != "plan") {
        Fail("retry after the scripted failure should succeed");
      }
    }
    if (reused.CallCount() != 4U) {
      Fail("reused generator should count both conversations");
    }
  }

  std::cout << "scripted_generator_smoke: ok\n";
  return 0;
}
