#pragma once

#include "agents/conversation.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace researchguard::artifacts {

// Longest per-turn preview shown in the agent trace of a report.
inline constexpr std::size_t kTracePreviewLimit = 200;

// Writes the canonical `result.json` for one processed query.
//
// Contract:
// - Creates `output_dir` if needed.
// - Publishes `<output_dir>/result.json` atomically (temp file + rename).
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteQueryResultJson(const agents::QueryResult& result,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

// Human-readable rendering: response, safety alert when blocked, agent
// trace with single-line previews, citations and metadata.
std::string RenderQueryReportMarkdown(const agents::QueryResult& result);

// Writes RenderQueryReportMarkdown output to `<output_dir>/report.md`.
bool WriteQueryReportMarkdown(const agents::QueryResult& result,
                              const std::filesystem::path& output_dir,
                              std::filesystem::path& written_path, std::string& error);

} // namespace researchguard::artifacts
