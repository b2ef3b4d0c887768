#pragma once

#include "agents/collaborators.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::tools {

inline constexpr std::size_t kMaxWebResults = 5;
inline constexpr std::size_t kWebSnippetLimit = 200;
inline constexpr std::size_t kMaxPaperResults = 3;
inline constexpr std::size_t kPaperAuthorLimit = 2;
inline constexpr std::size_t kPaperAbstractLimit = 50;

struct WebResult {
  std::string title;
  std::string url;
  std::string snippet;
};

struct PaperRecord {
  std::string title;
  std::optional<int> year;
  std::vector<std::string> authors;
  std::string abstract;
  std::string url;
  std::uint32_t citation_count = 0;
  std::string venue;
};

// "A, B" for up to two authors, "A, B et al." beyond that.
std::string FormatAuthors(const std::vector<std::string>& authors);

// Ranked text block handed to later roles. At most kMaxWebResults entries,
// snippets bounded by kWebSnippetLimit; kNoWebResults when empty.
std::string FormatWebResults(const std::vector<WebResult>& results);

// Drops papers outside [year_from, year_to] (papers without a year are
// dropped when either bound is set) or cited fewer than `min_citations`
// times, keeps at most kMaxPaperResults, abstracts bounded by
// kPaperAbstractLimit; kNoPaperResults when nothing is left.
std::string FormatPaperResults(const std::vector<PaperRecord>& papers,
                               const agents::PaperFilter& filter);

// Offline search corpus. Entries carry keywords; a query matches an entry
// when any query word appears in its title, text or keywords.
struct FixtureCorpus {
  struct WebEntry {
    WebResult result;
    std::vector<std::string> keywords;
  };
  struct PaperEntry {
    PaperRecord record;
    std::vector<std::string> keywords;
  };

  std::vector<WebEntry> web;
  std::vector<PaperEntry> papers;
  // Tools listed here fail every call, to exercise tool-failure handling.
  std::vector<agents::Capability> unavailable;
};

bool LoadFixtureCorpusText(std::string_view text, FixtureCorpus& corpus, std::string& error);
bool LoadFixtureCorpusFile(const std::filesystem::path& path, FixtureCorpus& corpus,
                           std::string& error);

// Research tools answered from a FixtureCorpus. Ranking is by number of
// matched query words, ties in corpus order. Deterministic, no I/O after load.
class FixtureResearchTools final : public agents::IResearchTools {
public:
  explicit FixtureResearchTools(FixtureCorpus corpus);

  bool WebSearch(const std::string& query, const core::CancellationToken& cancel,
                 std::string& output, std::string& error) override;

  bool PaperSearch(const std::string& query, const agents::PaperFilter& filter,
                   const core::CancellationToken& cancel, std::string& output,
                   std::string& error) override;

private:
  bool IsUnavailable(agents::Capability capability) const;

  FixtureCorpus corpus_;
};

} // namespace researchguard::tools
