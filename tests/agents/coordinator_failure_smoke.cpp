#include "agents/coordinator.hpp"
#include "common/assertions.hpp"
#include "common/conversation_fixtures.hpp"
#include "common/pipeline_fixtures.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using researchguard::agents::AgentRole;
using researchguard::agents::ConversationCoordinator;
using researchguard::agents::CoordinatorConfig;
using researchguard::agents::QueryResult;
using researchguard::agents::QueryStatus;
using researchguard::agents::TerminationReason;
using researchguard::backends::scripted::ScriptedGenerator;
using researchguard::core::CancellationToken;
using researchguard::tests::common::AssertContains;
using researchguard::tests::common::Fail;
using researchguard::tests::common::MakeOneRoundScript;
using researchguard::tests::common::MakeSampleCorpus;
using researchguard::tools::FixtureResearchTools;
using namespace std::chrono_literals;

CoordinatorConfig FastRetryConfig() {
  CoordinatorConfig config;
  config.retry.max_attempts = 3;
  config.retry.initial_backoff = 1ms;
  return config;
}

} // namespace

int main() {
  std::ostringstream log_output;
  researchguard::core::logging::Logger logger(researchguard::core::logging::LogLevel::kDebug,
                                              log_output);
  auto safety = researchguard::tests::common::MakeSafetyManager(logger, nullptr);
  const std::string query = researchguard::tests::common::kOnTopicQuery;

  {
    // Transient failures are absorbed by the retry budget.
    auto script = MakeOneRoundScript();
    script[2].fail_attempts = 2;
    ScriptedGenerator generator(std::move(script));
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(FastRetryConfig(), *safety, generator, tools, logger);

    QueryResult result;
    std::string error;
    if (!coordinator.ProcessQuery(query, result, error) ||
        result.status != QueryStatus::kCompleted) {
      Fail("writer should succeed on its third attempt");
    }
    if (generator.CallCount() != 6U) {
      Fail("expected four turns plus two failed writer attempts");
    }
  }

  {
    // Exhausted retries end the conversation with the partial transcript.
    auto script = MakeOneRoundScript();
    script[2].fail_attempts = 10;
    ScriptedGenerator generator(std::move(script));
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(FastRetryConfig(), *safety, generator, tools, logger);

    QueryResult result;
    std::string error;
    if (!coordinator.ProcessQuery(query, result, error)) {
      Fail("generation failure is a result, not a call error: " + error);
    }
    if (result.status != QueryStatus::kGenerationFailed ||
        result.termination_reason != TerminationReason::kGenerationFailed) {
      Fail("expected generation_failed status");
    }
    if (result.conversation_history.size() != 2U || !result.response.empty()) {
      Fail("failed writer turn must not be committed and no response returned");
    }
    AssertContains(result.error, "writer generation failed after 3 attempts");
    if (result.citations.size() != 2U) {
      Fail("citations from committed turns should still be reported");
    }
    AssertContains(log_output.str(), "generation attempts exhausted");
  }

  {
    // The request deadline interrupts a slow turn; committed turns are kept.
    auto script = MakeOneRoundScript();
    script[1].delay = 5s;
    CoordinatorConfig config = FastRetryConfig();
    config.request_timeout = 100ms;
    ScriptedGenerator generator(std::move(script));
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(std::move(config), *safety, generator, tools, logger);

    const auto started = std::chrono::steady_clock::now();
    QueryResult result;
    std::string error;
    if (!coordinator.ProcessQuery(query, result, error)) {
      Fail("timeout is a result, not a call error: " + error);
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (result.status != QueryStatus::kTimeout ||
        result.termination_reason != TerminationReason::kTimeout) {
      Fail("expected timeout status");
    }
    if (result.conversation_history.size() != 1U ||
        result.conversation_history[0].role != AgentRole::kPlanner) {
      Fail("only the planner turn should be committed before the deadline");
    }
    AssertContains(result.error, "deadline");
    if (!result.response.empty()) {
      Fail("a timed-out query has no response");
    }
    if (elapsed > 3s) {
      Fail("deadline was not honored promptly");
    }
  }

  {
    // A caller-owned token cancels from another thread. While the first call
    // runs, a second call on the same instance is rejected.
    auto script = MakeOneRoundScript();
    script[0].delay = 10s;
    ScriptedGenerator generator(std::move(script));
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(FastRetryConfig(), *safety, generator, tools, logger);

    CancellationToken cancel;
    QueryResult result;
    std::string error;
    std::atomic<bool> returned{false};
    bool ok = false;
    std::thread worker([&]() {
      ok = coordinator.ProcessQuery(query, cancel, result, error);
      returned.store(true);
    });

    while (generator.CallCount() == 0U) {
      std::this_thread::sleep_for(1ms);
    }
    QueryResult second;
    std::string second_error;
    if (coordinator.ProcessQuery(query, second, second_error)) {
      Fail("re-entrant ProcessQuery must be rejected");
    }
    AssertContains(second_error, "already processing");

    cancel.Cancel();
    worker.join();
    if (!returned.load() || !ok || result.status != QueryStatus::kTimeout ||
        !result.conversation_history.empty()) {
      Fail("cancelled query should end as a timeout with no committed turns");
    }

    // The instance is reusable after the first call returned.
    auto next_script = MakeOneRoundScript();
    ScriptedGenerator next_generator(std::move(next_script));
    ConversationCoordinator next(FastRetryConfig(), *safety, next_generator, tools, logger);
    QueryResult next_result;
    if (!next.ProcessQuery(query, next_result, error) ||
        next_result.status != QueryStatus::kCompleted) {
      Fail("a fresh coordinator should complete normally");
    }
  }

  {
    // A script whose roles do not follow the turn order fails generation.
    auto script = MakeOneRoundScript();
    script[1].role = AgentRole::kWriter;
    ScriptedGenerator generator(std::move(script));
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(FastRetryConfig(), *safety, generator, tools, logger);
    QueryResult result;
    std::string error;
    if (!coordinator.ProcessQuery(query, result, error) ||
        result.status != QueryStatus::kGenerationFailed) {
      Fail("role mismatch should surface as a generation failure");
    }
    AssertContains(result.error, "is for role writer, requested researcher");
  }

  {
    CoordinatorConfig config;
    config.termination.max_rounds = 0;
    ScriptedGenerator generator(MakeOneRoundScript());
    FixtureResearchTools tools(MakeSampleCorpus());
    ConversationCoordinator coordinator(std::move(config), *safety, generator, tools, logger);
    QueryResult result;
    std::string error;
    if (coordinator.ProcessQuery(query, result, error)) {
      Fail("zero max_rounds must be rejected before the conversation starts");
    }
    AssertContains(error, "max_rounds");
  }

  std::cout << "coordinator_failure_smoke: ok\n";
  return 0;
}
