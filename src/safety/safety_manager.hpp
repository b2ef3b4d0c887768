#pragma once

#include "core/logging/logger.hpp"
#include "events/audit_sink.hpp"
#include "events/safety_event.hpp"
#include "guardrails/input_guardrail.hpp"
#include "guardrails/output_guardrail.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::safety {

inline constexpr const char* kDefaultRefusalMessage =
    "I cannot process this request due to safety policies.";

// What to return in place of an unsafe response.
enum class ViolationAction {
  kRefuse,
  kSanitize,
};

struct SafetyConfig {
  bool enabled = true;
  // Audit events are recorded only when this is set.
  bool log_events = true;
  ViolationAction action = ViolationAction::kRefuse;
  std::string refusal_message = kDefaultRefusalMessage;
};

struct InputCheck {
  bool safe = true;
  std::vector<guardrails::Violation> violations;
  // Refusal text when unsafe, advisory note for low/medium findings, empty
  // when clean. Never echoes the offending text.
  std::string user_message;
  std::vector<std::string> rule_errors;
};

struct OutputCheck {
  bool safe = true;
  std::vector<guardrails::Violation> violations;
  std::string final_response;
  // Present only when the response was unsafe.
  std::optional<std::string> original_response;
  std::vector<std::string> rule_errors;
};

const char* ToString(ViolationAction action);
bool ParseViolationAction(std::string_view raw, ViolationAction& action);

// Maps the worst violation to the message shown to the user.
std::string BuildUserMessage(const std::vector<guardrails::Violation>& violations);

// Composes the input and output guardrails into the two safety gates and
// keeps the audit trail.
//
// Thread-safety: CheckInput/CheckOutput may be called from several
// coordinators at once. The event list, the per-direction check counters and
// the sink append are serialized on one mutex, so records reach the sink in
// the same order as they appear in `Events()`.
class SafetyManager {
public:
  // `sink` may be null, in which case events are kept in memory only.
  SafetyManager(SafetyConfig config, guardrails::InputGuardrail input_guardrail,
                guardrails::OutputGuardrail output_guardrail,
                std::shared_ptr<events::IAuditSink> sink, core::logging::Logger& logger);

  SafetyManager(const SafetyManager&) = delete;
  SafetyManager& operator=(const SafetyManager&) = delete;

  InputCheck CheckInput(std::string_view query);
  OutputCheck CheckOutput(std::string_view response);

  std::vector<events::SafetyEvent> Events() const;
  events::SafetyStats Stats() const;
  // Checks actually evaluated (disabled checks are not counted).
  std::size_t InputChecks() const;
  std::size_t OutputChecks() const;

  // Drops the in-process event list. The durable sink is never rewritten.
  void ClearEvents();

  const SafetyConfig& Config() const {
    return config_;
  }

private:
  void RecordEvent(events::Direction direction, std::string_view content, bool safe,
                   const std::vector<guardrails::Violation>& violations);

  SafetyConfig config_;
  guardrails::InputGuardrail input_guardrail_;
  guardrails::OutputGuardrail output_guardrail_;
  std::shared_ptr<events::IAuditSink> sink_;
  core::logging::Logger& logger_;

  mutable std::mutex mu_;
  std::vector<events::SafetyEvent> events_;
  std::size_t input_checks_ = 0;
  std::size_t output_checks_ = 0;
};

} // namespace researchguard::safety
