#include "agents/citations.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace researchguard::agents {

namespace {

// Characters that end a URL: whitespace plus <>"{}|\^`[]
bool IsUrlTerminator(char c) {
  if (std::isspace(static_cast<unsigned char>(c)) != 0) {
    return true;
  }
  constexpr std::string_view kTerminators = "<>\"{}|\\^`[]";
  return kTerminators.find(c) != std::string_view::npos;
}

bool StartsWithScheme(std::string_view text, std::size_t pos, std::size_t& body_start) {
  constexpr std::string_view kHttp = "http://";
  constexpr std::string_view kHttps = "https://";
  if (text.compare(pos, kHttps.size(), kHttps) == 0) {
    body_start = pos + kHttps.size();
    return true;
  }
  if (text.compare(pos, kHttp.size(), kHttp) == 0) {
    body_start = pos + kHttp.size();
    return true;
  }
  return false;
}

// Sentence punctuation after a URL belongs to the prose, not the URL. A
// closing parenthesis is kept only when the URL itself opened one.
std::size_t TrimTrailingPunctuation(std::string_view text, std::size_t start, std::size_t end,
                                    std::size_t body_start) {
  constexpr std::string_view kTrailing = ".,;:!?'";
  while (end > body_start) {
    const char last = text[end - 1];
    if (kTrailing.find(last) != std::string_view::npos) {
      --end;
      continue;
    }
    if (last == ')') {
      const std::string_view url = text.substr(start, end - start);
      const auto opened = std::count(url.begin(), url.end(), '(');
      const auto closed = std::count(url.begin(), url.end(), ')');
      if (closed > opened) {
        --end;
        continue;
      }
    }
    break;
  }
  return end;
}

void AppendUnique(std::vector<std::string>& citations, std::unordered_set<std::string>& seen,
                  std::string_view text, std::size_t max_citations) {
  for (auto& url : FindUrls(text)) {
    if (citations.size() >= max_citations) {
      return;
    }
    if (seen.insert(url).second) {
      citations.push_back(std::move(url));
    }
  }
}

} // namespace

std::vector<std::string> FindUrls(std::string_view text) {
  std::vector<std::string> urls;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t candidate = text.find("http", pos);
    if (candidate == std::string_view::npos) {
      break;
    }

    std::size_t body_start = 0;
    if (!StartsWithScheme(text, candidate, body_start)) {
      pos = candidate + 1;
      continue;
    }

    std::size_t end = body_start;
    while (end < text.size() && !IsUrlTerminator(text[end])) {
      ++end;
    }
    const std::size_t scanned_end = end;
    end = TrimTrailingPunctuation(text, candidate, end, body_start);
    // A bare scheme is not a URL.
    if (end == body_start) {
      pos = scanned_end;
      continue;
    }

    urls.emplace_back(text.substr(candidate, end - candidate));
    pos = scanned_end;
  }
  return urls;
}

std::vector<std::string> ExtractCitations(const std::vector<ConversationTurn>& transcript,
                                          std::size_t max_citations) {
  std::vector<std::string> citations;
  std::unordered_set<std::string> seen;
  for (const auto& turn : transcript) {
    AppendUnique(citations, seen, turn.content, max_citations);
    for (const auto& invocation : turn.tool_invocations) {
      AppendUnique(citations, seen, invocation.output, max_citations);
    }
    if (citations.size() >= max_citations) {
      break;
    }
  }
  return citations;
}

} // namespace researchguard::agents
