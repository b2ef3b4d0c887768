#ifndef RESEARCHGUARD_CORE_TEXT_UTILS_HPP_
#define RESEARCHGUARD_CORE_TEXT_UTILS_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace researchguard::core {

// Largest prefix length <= `limit` that does not split a UTF-8 sequence.
// Continuation bytes (10xxxxxx) are never a valid cut point.
inline std::size_t Utf8PrefixLength(std::string_view text, std::size_t limit) {
  if (text.size() <= limit) {
    return text.size();
  }
  std::size_t cut = limit;
  while (cut > 0U && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return cut;
}

// Cuts `text` to at most `limit` bytes on a character boundary and appends
// "..." when anything was dropped.
inline std::string TruncateWithEllipsis(std::string_view text, std::size_t limit) {
  if (text.size() <= limit) {
    return std::string(text);
  }
  return std::string(text.substr(0, Utf8PrefixLength(text, limit))) + "...";
}

} // namespace researchguard::core

#endif // RESEARCHGUARD_CORE_TEXT_UTILS_HPP_
