#include "events/safety_event.hpp"

#include "core/json_utils.hpp"
#include "core/text_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace researchguard::events {

const char* ToString(Direction direction) {
  switch (direction) {
  case Direction::kInput:
    return "input";
  case Direction::kOutput:
    return "output";
  }

  return "input";
}

bool ParseDirection(std::string_view raw, Direction& direction) {
  if (raw == "input") {
    direction = Direction::kInput;
    return true;
  }
  if (raw == "output") {
    direction = Direction::kOutput;
    return true;
  }
  return false;
}

std::string MakeContentPreview(std::string_view content) {
  return core::TruncateWithEllipsis(content, kContentPreviewLimit);
}

std::string ToJson(const SafetyEvent& event) {
  std::ostringstream out;
  out << "{"
      << "\"timestamp\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToString(event.direction) << "\","
      << "\"safe\":" << (event.safe ? "true" : "false") << ","
      << "\"violations\":" << guardrails::ToJson(event.violations) << ","
      << "\"content_preview\":" << core::QuoteJson(event.content_preview) << "}";
  return out.str();
}

SafetyStats ComputeSafetyStats(const std::vector<SafetyEvent>& events) {
  SafetyStats stats;
  stats.total_events = events.size();
  for (const auto& event : events) {
    if (event.direction == Direction::kInput) {
      ++stats.input_events;
    } else {
      ++stats.output_events;
    }
    if (!event.safe) {
      ++stats.unsafe_events;
    }
  }
  if (stats.total_events > 0U) {
    stats.violation_rate =
        static_cast<double>(stats.unsafe_events) / static_cast<double>(stats.total_events);
  }
  return stats;
}

std::string ToJson(const SafetyStats& stats) {
  std::ostringstream out;
  out << "{"
      << "\"total_events\":" << stats.total_events << ","
      << "\"input_events\":" << stats.input_events << ","
      << "\"output_events\":" << stats.output_events << ","
      << "\"unsafe_events\":" << stats.unsafe_events << ","
      << "\"violation_rate\":" << core::FormatFixedDouble(stats.violation_rate, 3) << "}";
  return out.str();
}

} // namespace researchguard::events
