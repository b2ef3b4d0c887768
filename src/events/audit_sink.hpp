#pragma once

#include "events/safety_event.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace researchguard::events {

// Append-only destination for safety audit records. Owned by SafetyManager's
// caller and injected into it, so tests can substitute an in-memory sink and
// assert on the exact records written.
//
// Contract:
// - `Append` writes exactly one record per call and never rewrites earlier
//   records.
// - Implementations serialize concurrent `Append` calls.
// - Returns false with `error` populated on failure.
class IAuditSink {
public:
  virtual ~IAuditSink() = default;

  virtual bool Append(const SafetyEvent& event, std::string& error) = 0;
};

// Appends one JSON-serialized event per line to `path`.
//
// - Creates the parent directory on first append if needed.
// - Opens the file in append mode for every record, so external rotation of
//   the file between records is tolerated.
class JsonlAuditSink final : public IAuditSink {
public:
  explicit JsonlAuditSink(std::filesystem::path path);

  bool Append(const SafetyEvent& event, std::string& error) override;

  const std::filesystem::path& Path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::mutex mu_;
};

// Keeps records in memory in append order.
class MemoryAuditSink final : public IAuditSink {
public:
  bool Append(const SafetyEvent& event, std::string& error) override;

  std::vector<SafetyEvent> Events() const;
  // Serialized records, one string per Append, in order.
  std::vector<std::string> Lines() const;

private:
  mutable std::mutex mu_;
  std::vector<SafetyEvent> events_;
  std::vector<std::string> lines_;
};

// Reads a JSONL audit file back into events. Blank lines are skipped; any
// malformed line fails the whole read with its line number in `error`.
bool ReadAuditLogJsonl(const std::filesystem::path& path, std::vector<SafetyEvent>& events,
                       std::string& error);

} // namespace researchguard::events
