#include "agents/generation_retry.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace researchguard::agents {

std::chrono::milliseconds ComputeBackoff(const std::chrono::milliseconds initial_backoff,
                                         const std::uint32_t retry_index) {
  if (retry_index == 0U || initial_backoff.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  using Rep = std::chrono::milliseconds::rep;
  constexpr Rep kMax = std::numeric_limits<Rep>::max();
  Rep backoff = initial_backoff.count();
  for (std::uint32_t i = 1; i < retry_index; ++i) {
    if (backoff > kMax / 2) {
      return std::chrono::milliseconds(kMax);
    }
    backoff *= 2;
  }
  return std::chrono::milliseconds(backoff);
}

GenerationAttemptResult ExecuteGenerationAttempts(IGenerator& generator,
                                                  const GenerationRequest& request,
                                                  const RetryPolicy& policy,
                                                  const core::CancellationToken& cancel,
                                                  core::logging::Logger& logger) {
  GenerationAttemptResult result;
  const char* role_name = ToString(request.role);

  if (policy.max_attempts == 0U) {
    result.error = "generation attempt budget is zero";
    return result;
  }

  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (cancel.ShouldStop()) {
      result.outcome = GenerationOutcome::kCancelled;
      result.error = "deadline reached before generation attempt";
      return result;
    }

    ++result.attempts_used;
    GenerationReply reply;
    std::string generate_error;
    if (generator.Generate(request, cancel, reply, generate_error)) {
      if (attempt > 1U) {
        logger.Info("generation retry succeeded",
                    {{"role", role_name}, {"attempt", std::to_string(attempt)}});
      }
      result.outcome = GenerationOutcome::kSucceeded;
      result.reply = std::move(reply);
      result.error.clear();
      return result;
    }

    result.error = generate_error.empty() ? "generator returned no reply" : generate_error;
    logger.Warn("generation attempt failed",
                {{"role", role_name},
                 {"attempt", std::to_string(attempt)},
                 {"max_attempts", std::to_string(policy.max_attempts)},
                 {"error", result.error}});

    if (cancel.ShouldStop()) {
      result.outcome = GenerationOutcome::kCancelled;
      return result;
    }
    if (attempt == policy.max_attempts) {
      break;
    }

    // Never sleep past the deadline.
    const std::chrono::milliseconds backoff = ComputeBackoff(policy.initial_backoff, attempt);
    const std::chrono::milliseconds wait = std::min(backoff, cancel.Remaining(backoff));
    if (!cancel.SleepFor(wait)) {
      result.outcome = GenerationOutcome::kCancelled;
      return result;
    }
  }

  result.outcome = GenerationOutcome::kExhausted;
  return result;
}

} // namespace researchguard::agents
