#pragma once

#include "agents/collaborators.hpp"
#include "core/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace researchguard::core::logging {
class Logger;
}

namespace researchguard::agents {

constexpr std::uint32_t kDefaultGenerationAttempts = 3U;
constexpr std::chrono::milliseconds kDefaultInitialBackoff{200};

struct RetryPolicy {
  std::uint32_t max_attempts = kDefaultGenerationAttempts;
  std::chrono::milliseconds initial_backoff = kDefaultInitialBackoff;
};

// Backoff before retry number `retry_index` (1 = first retry): initial
// doubled per prior retry, saturating instead of overflowing.
std::chrono::milliseconds ComputeBackoff(std::chrono::milliseconds initial_backoff,
                                         std::uint32_t retry_index);

enum class GenerationOutcome {
  kSucceeded,
  kExhausted,
  kCancelled,
};

struct GenerationAttemptResult {
  GenerationOutcome outcome = GenerationOutcome::kExhausted;
  std::uint32_t attempts_used = 0;
  GenerationReply reply;
  // Last generator error, or why the attempts stopped early.
  std::string error;
};

// Calls the generator up to `policy.max_attempts` times, sleeping the backoff
// between failures. The cancellation token is checked before every attempt
// and during every backoff; a fired token stops with kCancelled.
GenerationAttemptResult ExecuteGenerationAttempts(IGenerator& generator,
                                                  const GenerationRequest& request,
                                                  const RetryPolicy& policy,
                                                  const core::CancellationToken& cancel,
                                                  core::logging::Logger& logger);

} // namespace researchguard::agents
