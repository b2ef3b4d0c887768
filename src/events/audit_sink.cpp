#include "events/audit_sink.hpp"

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace researchguard::events {

namespace {

using JsonValue = core::json::Value;

bool ParseTimestamp(const std::string& text, std::chrono::system_clock::time_point& ts) {
  // Expected shape: YYYY-MM-DDTHH:MM:SS.mmmZ
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int millis = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ", &year, &month, &day, &hour,
                  &minute, &second, &millis) != 7) {
    return false;
  }

  const std::chrono::year_month_day ymd{std::chrono::year(year),
                                        std::chrono::month(static_cast<unsigned>(month)),
                                        std::chrono::day(static_cast<unsigned>(day))};
  if (!ymd.ok()) {
    return false;
  }
  ts = std::chrono::sys_days(ymd) + std::chrono::hours(hour) + std::chrono::minutes(minute) +
       std::chrono::seconds(second) + std::chrono::milliseconds(millis);
  return true;
}

bool ParseViolation(const JsonValue& value, guardrails::Violation& violation,
                    std::string& error) {
  const JsonValue* validator = value.Find("validator");
  const JsonValue* severity = value.Find("severity");
  const JsonValue* reason = value.Find("reason");
  if (validator == nullptr || !validator->IsString() ||
      !guardrails::ParseValidator(validator->string_value, violation.validator)) {
    error = "violation.validator is missing or unknown";
    return false;
  }
  if (severity == nullptr || !severity->IsString() ||
      !guardrails::ParseSeverity(severity->string_value, violation.severity)) {
    error = "violation.severity is missing or unknown";
    return false;
  }
  if (reason != nullptr && reason->IsString()) {
    violation.reason = reason->string_value;
  }
  if (const JsonValue* matches = value.Find("matches"); matches != nullptr) {
    if (!core::json::ReadStringArray(*matches, violation.matches)) {
      error = "violation.matches must be an array of strings";
      return false;
    }
  }
  if (const JsonValue* pii_type = value.Find("pii_type");
      pii_type != nullptr && pii_type->IsString()) {
    violation.pii_type = pii_type->string_value;
  }
  return true;
}

bool ParseEventLine(const std::string& line, SafetyEvent& event, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(line, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "record must be a JSON object";
    return false;
  }

  const JsonValue* timestamp = root.Find("timestamp");
  if (timestamp == nullptr || !timestamp->IsString() ||
      !ParseTimestamp(timestamp->string_value, event.ts)) {
    error = "timestamp is missing or malformed";
    return false;
  }
  const JsonValue* type = root.Find("type");
  if (type == nullptr || !type->IsString() || !ParseDirection(type->string_value, event.direction)) {
    error = "type must be \"input\" or \"output\"";
    return false;
  }
  const JsonValue* safe = root.Find("safe");
  if (safe == nullptr || !safe->IsBool()) {
    error = "safe must be a boolean";
    return false;
  }
  event.safe = safe->bool_value;

  const JsonValue* violations = root.Find("violations");
  if (violations == nullptr || !violations->IsArray()) {
    error = "violations must be an array";
    return false;
  }
  for (const auto& item : violations->array_value) {
    guardrails::Violation violation;
    if (!ParseViolation(item, violation, error)) {
      return false;
    }
    event.violations.push_back(std::move(violation));
  }

  if (const JsonValue* preview = root.Find("content_preview");
      preview != nullptr && preview->IsString()) {
    event.content_preview = preview->string_value;
  }
  return true;
}

} // namespace

JsonlAuditSink::JsonlAuditSink(fs::path path) : path_(std::move(path)) {}

bool JsonlAuditSink::Append(const SafetyEvent& event, std::string& error) {
  if (path_.empty()) {
    error = "audit log path cannot be empty";
    return false;
  }

  // Serialize outside the lock; only the file append needs single-writer
  // discipline.
  const std::string line = ToJson(event);

  std::lock_guard<std::mutex> lock(mu_);
  const fs::path parent = path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      error = "failed to create audit directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  std::ofstream out_file(path_, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open audit log '" + path_.string() + "' for append";
    return false;
  }

  out_file << line << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while writing audit log '" + path_.string() + "'";
    return false;
  }

  return true;
}

bool MemoryAuditSink::Append(const SafetyEvent& event, std::string& error) {
  error.clear();
  std::string line = ToJson(event);
  std::lock_guard<std::mutex> lock(mu_);
  events_.push_back(event);
  lines_.push_back(std::move(line));
  return true;
}

std::vector<SafetyEvent> MemoryAuditSink::Events() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_;
}

std::vector<std::string> MemoryAuditSink::Lines() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lines_;
}

bool ReadAuditLogJsonl(const fs::path& path, std::vector<SafetyEvent>& events,
                       std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open audit log '" + path.string() + "'";
    return false;
  }

  std::vector<SafetyEvent> parsed;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    SafetyEvent event;
    std::string line_error;
    if (!ParseEventLine(line, event, line_error)) {
      error = path.string() + ":" + std::to_string(line_number) + ": " + line_error;
      return false;
    }
    parsed.push_back(std::move(event));
  }

  events = std::move(parsed);
  return true;
}

} // namespace researchguard::events
