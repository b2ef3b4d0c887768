#include "artifacts/result_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace researchguard::artifacts {

namespace {

std::string SingleLinePreview(const std::string& content) {
  std::string preview = core::TruncateWithEllipsis(content, kTracePreviewLimit);
  for (char& c : preview) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return preview;
}

void WriteViolationList(std::ostringstream& out,
                        const std::vector<guardrails::Violation>& violations) {
  for (const auto& violation : violations) {
    out << "- " << guardrails::ToString(violation.validator) << " ("
        << guardrails::ToString(violation.severity) << "): " << violation.reason << "\n";
  }
}

void WriteTraceSection(std::ostringstream& out, const agents::QueryResult& result) {
  out << "## Agent Trace\n\n";
  if (result.conversation_history.empty()) {
    out << "No turns were committed.\n\n";
    return;
  }
  for (const auto& turn : result.conversation_history) {
    out << turn.index + 1 << ". **" << agents::ToString(turn.role) << "**: "
        << SingleLinePreview(turn.content) << "\n";
    for (const auto& invocation : turn.tool_invocations) {
      out << "   - " << agents::ToString(invocation.capability) << "(\"" << invocation.query
          << "\")" << (invocation.succeeded ? "" : " failed: " + invocation.error) << "\n";
    }
  }
  out << "\n";
}

} // namespace

bool WriteQueryResultJson(const agents::QueryResult& result, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  written_path = output_dir / "result.json";
  // Trailing newline keeps the file shell-friendly (`cat`, diffs).
  return core::WriteTextFileAtomic(written_path, agents::ToJson(result) + "\n", error);
}

std::string RenderQueryReportMarkdown(const agents::QueryResult& result) {
  std::ostringstream out;
  out << "# Research Result\n\n"
      << "- Query: " << result.query << "\n"
      << "- Status: " << agents::ToString(result.status) << "\n";
  if (result.termination_reason.has_value()) {
    out << "- Termination: " << agents::ToString(result.termination_reason.value()) << "\n";
  }
  out << "\n";

  if (result.metadata.blocked) {
    out << "## Safety Alert\n\n"
        << "The query was blocked.\n\n";
    WriteViolationList(out, result.metadata.safety_violations);
    out << "\n";
  }
  if (!result.error.empty()) {
    out << "## Error\n\n" << result.error << "\n\n";
  }
  if (!result.metadata.input_advisory.empty()) {
    out << "> " << result.metadata.input_advisory << "\n\n";
  }

  out << "## Response\n\n" << (result.response.empty() ? "(none)" : result.response) << "\n\n";

  if (!result.metadata.blocked) {
    WriteTraceSection(out, result);
  }

  if (!result.citations.empty()) {
    out << "## Citations\n\n";
    for (std::size_t i = 0; i < result.citations.size(); ++i) {
      out << "[" << i + 1 << "] " << result.citations[i] << "\n";
    }
    out << "\n";
  }

  out << "## Metadata\n\n"
      << "- Messages: " << result.metadata.num_messages << "\n"
      << "- Sources: " << result.metadata.num_sources << "\n"
      << "- Safety check: " << (result.metadata.safety_check_passed ? "PASSED" : "FLAGGED")
      << "\n";
  if (!result.metadata.blocked && !result.metadata.safety_violations.empty()) {
    out << "\n### Safety Findings\n\n";
    WriteViolationList(out, result.metadata.safety_violations);
  }
  return out.str();
}

bool WriteQueryReportMarkdown(const agents::QueryResult& result, const fs::path& output_dir,
                              fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  written_path = output_dir / "report.md";
  return core::WriteTextFileAtomic(written_path, RenderQueryReportMarkdown(result), error);
}

} // namespace researchguard::artifacts
