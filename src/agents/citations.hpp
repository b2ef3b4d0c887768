#pragma once

#include "agents/conversation.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace researchguard::agents {

inline constexpr std::size_t kDefaultMaxCitations = 10;

// Absolute http/https URLs found in `text`, in order of appearance,
// duplicates included. Trailing sentence punctuation and an unbalanced
// closing parenthesis are not part of the URL.
std::vector<std::string> FindUrls(std::string_view text);

// Collects citation URLs from every turn's content and tool output.
// First-seen order, deduplicated, at most `max_citations` entries.
std::vector<std::string> ExtractCitations(const std::vector<ConversationTurn>& transcript,
                                          std::size_t max_citations = kDefaultMaxCitations);

} // namespace researchguard::agents
