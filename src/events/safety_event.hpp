#pragma once

#include "guardrails/violation.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::events {

enum class Direction {
  kInput,
  kOutput,
};

// Longest content preview stored in an audit record, before the "..." marker.
constexpr std::size_t kContentPreviewLimit = 100;

// One audit record. Written once by SafetyManager and never mutated.
//
// - `ts`: wall-clock time the check completed.
// - `direction`: which gate produced the record.
// - `safe`: verdict of that gate.
// - `content_preview`: at most kContentPreviewLimit chars of the checked text,
//   with "..." appended when truncated.
struct SafetyEvent {
  std::chrono::system_clock::time_point ts{};
  Direction direction = Direction::kInput;
  bool safe = true;
  std::vector<guardrails::Violation> violations;
  std::string content_preview;
};

// Aggregates over an event list. `violation_rate` is unsafe/total, 0 when
// the list is empty.
struct SafetyStats {
  std::size_t total_events = 0;
  std::size_t input_events = 0;
  std::size_t output_events = 0;
  std::size_t unsafe_events = 0;
  double violation_rate = 0.0;
};

const char* ToString(Direction direction);
bool ParseDirection(std::string_view raw, Direction& direction);

std::string MakeContentPreview(std::string_view content);

// One-line JSON used by the JSONL audit sink:
// {"timestamp":...,"type":"input|output","safe":...,"violations":[...],
//  "content_preview":...}
std::string ToJson(const SafetyEvent& event);

SafetyStats ComputeSafetyStats(const std::vector<SafetyEvent>& events);
std::string ToJson(const SafetyStats& stats);

} // namespace researchguard::events
