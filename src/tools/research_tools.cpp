#include "tools/research_tools.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <utility>

namespace researchguard::tools {

namespace {

using JsonValue = core::json::Value;

// Query words shorter than this are ignored when matching.
constexpr std::size_t kMinQueryWordLength = 3;

constexpr int kMinPaperYear = 0;
constexpr int kMaxPaperYear = 9999;

std::string Lower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::vector<std::string> QueryWords(std::string_view query) {
  std::vector<std::string> words;
  std::string current;
  for (const char c : query) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
      current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      continue;
    }
    if (current.size() >= kMinQueryWordLength) {
      words.push_back(current);
    }
    current.clear();
  }
  if (current.size() >= kMinQueryWordLength) {
    words.push_back(current);
  }
  return words;
}

std::size_t CountHits(const std::vector<std::string>& words, const std::string& haystack) {
  std::size_t hits = 0;
  for (const auto& word : words) {
    if (haystack.find(word) != std::string::npos) {
      ++hits;
    }
  }
  return hits;
}

std::string JoinLowered(std::initializer_list<std::string_view> parts,
                        const std::vector<std::string>& keywords) {
  std::string joined;
  for (const auto part : parts) {
    joined += Lower(part);
    joined += '\n';
  }
  for (const auto& keyword : keywords) {
    joined += Lower(keyword);
    joined += '\n';
  }
  return joined;
}

// Indices of matching entries, best first, stable on ties.
template <typename Entry, typename HaystackFn>
std::vector<std::size_t> RankEntries(const std::vector<Entry>& entries,
                                     const std::vector<std::string>& words,
                                     HaystackFn haystack_of) {
  std::vector<std::pair<std::size_t, std::size_t>> scored;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const std::size_t hits = CountHits(words, haystack_of(entries[i]));
    if (hits > 0U) {
      scored.emplace_back(hits, i);
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });

  std::vector<std::size_t> ranked;
  ranked.reserve(scored.size());
  for (const auto& entry : scored) {
    ranked.push_back(entry.second);
  }
  return ranked;
}

bool ReadRequiredString(const JsonValue& object, std::string_view key, const std::string& path,
                        std::string& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || !value->IsString()) {
    error = path + "." + std::string(key) + " must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadOptionalStringArray(const JsonValue& object, std::string_view key,
                             const std::string& path, std::vector<std::string>& out,
                             std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!core::json::ReadStringArray(*value, out)) {
    error = path + "." + std::string(key) + " must be an array of strings";
    return false;
  }
  return true;
}

bool ParseWebEntry(const JsonValue& item, const std::string& path,
                   FixtureCorpus::WebEntry& entry, std::string& error) {
  if (!item.IsObject()) {
    error = path + " must be an object";
    return false;
  }
  if (!ReadRequiredString(item, "title", path, entry.result.title, error) ||
      !ReadRequiredString(item, "url", path, entry.result.url, error)) {
    return false;
  }
  if (const JsonValue* snippet = item.Find("snippet"); snippet != nullptr) {
    if (!snippet->IsString()) {
      error = path + ".snippet must be a string";
      return false;
    }
    entry.result.snippet = snippet->string_value;
  }
  return ReadOptionalStringArray(item, "keywords", path, entry.keywords, error);
}

bool ParsePaperEntry(const JsonValue& item, const std::string& path,
                     FixtureCorpus::PaperEntry& entry, std::string& error) {
  if (!item.IsObject()) {
    error = path + " must be an object";
    return false;
  }
  if (!ReadRequiredString(item, "title", path, entry.record.title, error)) {
    return false;
  }
  if (const JsonValue* year = item.Find("year"); year != nullptr) {
    int parsed_year = 0;
    if (!core::json::ReadBoundedInteger(*year, kMinPaperYear, kMaxPaperYear, parsed_year)) {
      error = path + ".year must be an integer in [" + std::to_string(kMinPaperYear) + ", " +
              std::to_string(kMaxPaperYear) + "]";
      return false;
    }
    entry.record.year = parsed_year;
  }
  if (const JsonValue* citations = item.Find("citation_count"); citations != nullptr) {
    if (!core::json::ReadBoundedInteger(*citations, std::uint32_t{0},
                                        std::numeric_limits<std::uint32_t>::max(),
                                        entry.record.citation_count)) {
      error = path + ".citation_count must be a non-negative integer";
      return false;
    }
  }
  if (const JsonValue* venue = item.Find("venue"); venue != nullptr) {
    if (!venue->IsString()) {
      error = path + ".venue must be a string";
      return false;
    }
    entry.record.venue = venue->string_value;
  }
  if (const JsonValue* abstract = item.Find("abstract"); abstract != nullptr) {
    if (!abstract->IsString()) {
      error = path + ".abstract must be a string";
      return false;
    }
    entry.record.abstract = abstract->string_value;
  }
  if (const JsonValue* url = item.Find("url"); url != nullptr) {
    if (!url->IsString()) {
      error = path + ".url must be a string";
      return false;
    }
    entry.record.url = url->string_value;
  }
  return ReadOptionalStringArray(item, "authors", path, entry.record.authors, error) &&
         ReadOptionalStringArray(item, "keywords", path, entry.keywords, error);
}

} // namespace

std::string FormatAuthors(const std::vector<std::string>& authors) {
  std::string formatted;
  const std::size_t shown = std::min(authors.size(), kPaperAuthorLimit);
  for (std::size_t i = 0; i < shown; ++i) {
    if (i != 0U) {
      formatted += ", ";
    }
    formatted += authors[i];
  }
  if (authors.size() > kPaperAuthorLimit) {
    formatted += " et al.";
  }
  return formatted;
}

std::string FormatWebResults(const std::vector<WebResult>& results) {
  if (results.empty()) {
    return agents::kNoWebResults;
  }

  const std::size_t shown = std::min(results.size(), kMaxWebResults);
  std::ostringstream out;
  out << "Found " << shown << " web results:\n";
  for (std::size_t i = 0; i < shown; ++i) {
    const WebResult& result = results[i];
    out << (i + 1) << ". " << result.title << "\n"
        << "   " << result.url << "\n";
    if (!result.snippet.empty()) {
      out << "   " << core::TruncateWithEllipsis(result.snippet, kWebSnippetLimit) << "\n";
    }
  }
  return out.str();
}

std::string FormatPaperResults(const std::vector<PaperRecord>& papers,
                               const agents::PaperFilter& filter) {
  std::vector<const PaperRecord*> kept;
  for (const auto& paper : papers) {
    if (kept.size() >= kMaxPaperResults) {
      break;
    }
    if (filter.year_from.has_value() &&
        (!paper.year.has_value() || paper.year.value() < filter.year_from.value())) {
      continue;
    }
    if (filter.year_to.has_value() &&
        (!paper.year.has_value() || paper.year.value() > filter.year_to.value())) {
      continue;
    }
    if (paper.citation_count < filter.min_citations) {
      continue;
    }
    kept.push_back(&paper);
  }
  if (kept.empty()) {
    return agents::kNoPaperResults;
  }

  std::ostringstream out;
  out << "Found " << kept.size() << " papers:\n";
  for (std::size_t i = 0; i < kept.size(); ++i) {
    const PaperRecord& paper = *kept[i];
    out << (i + 1) << ". " << paper.title << " (";
    if (paper.year.has_value()) {
      out << paper.year.value();
    } else {
      out << "n.d.";
    }
    out << ")\n";
    if (!paper.authors.empty()) {
      out << "   " << FormatAuthors(paper.authors) << "\n";
    }
    if (!paper.abstract.empty()) {
      out << "   " << core::TruncateWithEllipsis(paper.abstract, kPaperAbstractLimit) << "\n";
    }
    if (!paper.venue.empty() || paper.citation_count > 0U) {
      out << "   ";
      if (!paper.venue.empty()) {
        out << paper.venue << (paper.citation_count > 0U ? ", " : "");
      }
      if (paper.citation_count > 0U) {
        out << "cited by " << paper.citation_count;
      }
      out << "\n";
    }
    if (!paper.url.empty()) {
      out << "   " << paper.url << "\n";
    }
  }
  return out.str();
}

bool LoadFixtureCorpusText(std::string_view text, FixtureCorpus& corpus, std::string& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid corpus JSON: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "corpus root must be a JSON object";
    return false;
  }

  FixtureCorpus parsed;
  if (const JsonValue* web = root.Find("web"); web != nullptr) {
    if (!web->IsArray()) {
      error = "web must be an array";
      return false;
    }
    for (std::size_t i = 0; i < web->array_value.size(); ++i) {
      FixtureCorpus::WebEntry entry;
      if (!ParseWebEntry(web->array_value[i], "web[" + std::to_string(i) + "]", entry, error)) {
        return false;
      }
      parsed.web.push_back(std::move(entry));
    }
  }
  if (const JsonValue* papers = root.Find("papers"); papers != nullptr) {
    if (!papers->IsArray()) {
      error = "papers must be an array";
      return false;
    }
    for (std::size_t i = 0; i < papers->array_value.size(); ++i) {
      FixtureCorpus::PaperEntry entry;
      if (!ParsePaperEntry(papers->array_value[i], "papers[" + std::to_string(i) + "]", entry,
                           error)) {
        return false;
      }
      parsed.papers.push_back(std::move(entry));
    }
  }
  if (const JsonValue* unavailable = root.Find("unavailable"); unavailable != nullptr) {
    std::vector<std::string> names;
    if (!core::json::ReadStringArray(*unavailable, names)) {
      error = "unavailable must be an array of strings";
      return false;
    }
    for (const auto& name : names) {
      agents::Capability capability = agents::Capability::kNone;
      if (!agents::ParseCapability(name, capability)) {
        error = "unavailable: unknown tool '" + name + "' (expected web_search|paper_search)";
        return false;
      }
      parsed.unavailable.push_back(capability);
    }
  }

  corpus = std::move(parsed);
  return true;
}

bool LoadFixtureCorpusFile(const std::filesystem::path& path, FixtureCorpus& corpus,
                           std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!LoadFixtureCorpusText(text, corpus, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

FixtureResearchTools::FixtureResearchTools(FixtureCorpus corpus) : corpus_(std::move(corpus)) {}

bool FixtureResearchTools::IsUnavailable(agents::Capability capability) const {
  return std::find(corpus_.unavailable.begin(), corpus_.unavailable.end(), capability) !=
         corpus_.unavailable.end();
}

bool FixtureResearchTools::WebSearch(const std::string& query,
                                     const core::CancellationToken& cancel, std::string& output,
                                     std::string& error) {
  if (cancel.ShouldStop()) {
    error = "web_search cancelled";
    return false;
  }
  if (IsUnavailable(agents::Capability::kWebSearch)) {
    error = "web_search is unavailable";
    return false;
  }

  const std::vector<std::string> words = QueryWords(query);
  const auto ranked = RankEntries(corpus_.web, words, [](const FixtureCorpus::WebEntry& entry) {
    return JoinLowered({entry.result.title, entry.result.snippet}, entry.keywords);
  });

  std::vector<WebResult> results;
  for (const std::size_t index : ranked) {
    results.push_back(corpus_.web[index].result);
  }
  output = FormatWebResults(results);
  return true;
}

bool FixtureResearchTools::PaperSearch(const std::string& query,
                                       const agents::PaperFilter& filter,
                                       const core::CancellationToken& cancel,
                                       std::string& output, std::string& error) {
  if (cancel.ShouldStop()) {
    error = "paper_search cancelled";
    return false;
  }
  if (IsUnavailable(agents::Capability::kPaperSearch)) {
    error = "paper_search is unavailable";
    return false;
  }

  const std::vector<std::string> words = QueryWords(query);
  const auto ranked =
      RankEntries(corpus_.papers, words, [](const FixtureCorpus::PaperEntry& entry) {
        return JoinLowered({entry.record.title, entry.record.abstract}, entry.keywords);
      });

  std::vector<PaperRecord> papers;
  for (const std::size_t index : ranked) {
    papers.push_back(corpus_.papers[index].record);
  }
  output = FormatPaperResults(papers, filter);
  return true;
}

} // namespace researchguard::tools
