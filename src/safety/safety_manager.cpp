#include "safety/safety_manager.hpp"

#include <chrono>
#include <utility>

namespace researchguard::safety {

namespace {

constexpr const char* kToxicityMessage =
    "I cannot process this query as it may contain harmful content.";
constexpr const char* kInjectionMessage =
    "I detected a potential prompt injection attempt. Please rephrase your query.";
constexpr const char* kPiiMessage = "I cannot process requests containing personal information.";
constexpr const char* kAdvisoryMessage =
    "Note: Your query has been flagged for review but will be processed.";

void LogRuleErrors(core::logging::Logger& logger, const char* gate,
                   const std::vector<std::string>& rule_errors) {
  for (const auto& rule_error : rule_errors) {
    logger.Warn("guardrail rule failed open", {{"gate", gate}, {"error", rule_error}});
  }
}

} // namespace

const char* ToString(ViolationAction action) {
  switch (action) {
  case ViolationAction::kRefuse:
    return "refuse";
  case ViolationAction::kSanitize:
    return "sanitize";
  }

  return "refuse";
}

bool ParseViolationAction(std::string_view raw, ViolationAction& action) {
  if (raw == "refuse") {
    action = ViolationAction::kRefuse;
    return true;
  }
  if (raw == "sanitize") {
    action = ViolationAction::kSanitize;
    return true;
  }
  return false;
}

std::string BuildUserMessage(const std::vector<guardrails::Violation>& violations) {
  const guardrails::Violation* worst = guardrails::FindWorstViolation(violations);
  if (worst == nullptr) {
    return "";
  }
  if (worst->severity != guardrails::Severity::kHigh) {
    return kAdvisoryMessage;
  }

  switch (worst->validator) {
  case guardrails::Validator::kToxicity:
    return kToxicityMessage;
  case guardrails::Validator::kPromptInjection:
    return kInjectionMessage;
  case guardrails::Validator::kPii:
    return kPiiMessage;
  default:
    return kDefaultRefusalMessage;
  }
}

SafetyManager::SafetyManager(SafetyConfig config, guardrails::InputGuardrail input_guardrail,
                             guardrails::OutputGuardrail output_guardrail,
                             std::shared_ptr<events::IAuditSink> sink,
                             core::logging::Logger& logger)
    : config_(std::move(config)),
      input_guardrail_(std::move(input_guardrail)),
      output_guardrail_(std::move(output_guardrail)),
      sink_(std::move(sink)),
      logger_(logger) {
  logger_.Info("safety manager initialized",
               {{"enabled", config_.enabled ? "true" : "false"},
                {"log_events", config_.log_events ? "true" : "false"},
                {"action", ToString(config_.action)}});
}

InputCheck SafetyManager::CheckInput(std::string_view query) {
  InputCheck check;
  if (!config_.enabled) {
    return check;
  }

  guardrails::ValidationResult result = input_guardrail_.Validate(query);
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++input_checks_;
  }
  LogRuleErrors(logger_, "input", result.rule_errors);

  check.safe = !result.blocked;
  check.user_message = BuildUserMessage(result.violations);
  check.rule_errors = std::move(result.rule_errors);
  if (!result.violations.empty() && config_.log_events) {
    RecordEvent(events::Direction::kInput, query, check.safe, result.violations);
  }
  check.violations = std::move(result.violations);
  return check;
}

OutputCheck SafetyManager::CheckOutput(std::string_view response) {
  OutputCheck check;
  if (!config_.enabled) {
    check.final_response = std::string(response);
    return check;
  }

  guardrails::ValidationResult result = output_guardrail_.Validate(response);
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++output_checks_;
  }
  LogRuleErrors(logger_, "output", result.rule_errors);

  check.safe = !result.blocked;
  // The redacted text is returned even for safe responses; only the refusal
  // policy can replace it.
  const std::string sanitized = result.sanitized_text.value_or(std::string(response));
  if (check.safe) {
    check.final_response = sanitized;
  } else {
    check.final_response =
        config_.action == ViolationAction::kRefuse ? config_.refusal_message : sanitized;
    check.original_response = std::string(response);
  }

  check.rule_errors = std::move(result.rule_errors);
  if (!result.violations.empty() && config_.log_events) {
    RecordEvent(events::Direction::kOutput, response, check.safe, result.violations);
  }
  check.violations = std::move(result.violations);
  return check;
}

void SafetyManager::RecordEvent(events::Direction direction, std::string_view content, bool safe,
                                const std::vector<guardrails::Violation>& violations) {
  events::SafetyEvent event;
  event.ts = std::chrono::system_clock::now();
  event.direction = direction;
  event.safe = safe;
  event.violations = violations;
  event.content_preview = events::MakeContentPreview(content);

  const char* direction_name = events::ToString(direction);
  if (safe) {
    logger_.Info("safety check flagged content",
                 {{"direction", direction_name},
                  {"violations", std::to_string(violations.size())}});
  } else {
    logger_.Warn("safety event",
                 {{"direction", direction_name},
                  {"violations", std::to_string(violations.size())}});
  }
  for (const auto& violation : violations) {
    logger_.Debug("violation", {{"validator", guardrails::ToString(violation.validator)},
                                {"severity", guardrails::ToString(violation.severity)},
                                {"reason", violation.reason}});
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (sink_ != nullptr) {
    std::string sink_error;
    if (!sink_->Append(event, sink_error)) {
      logger_.Error("failed to write safety audit record", {{"error", sink_error}});
    }
  }
  events_.push_back(std::move(event));
}

std::vector<events::SafetyEvent> SafetyManager::Events() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_;
}

events::SafetyStats SafetyManager::Stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events::ComputeSafetyStats(events_);
}

std::size_t SafetyManager::InputChecks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return input_checks_;
}

std::size_t SafetyManager::OutputChecks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return output_checks_;
}

void SafetyManager::ClearEvents() {
  std::lock_guard<std::mutex> lock(mu_);
  events_.clear();
}

} // namespace researchguard::safety
