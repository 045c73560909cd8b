#include "link_scanner.h"

#include <cctype>
#include <cstddef>
#include <utility>

namespace sft::transfer {

namespace {

constexpr std::string_view kSchemes[] = {"https://", "aesgcm://"};

bool StartsWithIgnoreCase(std::string_view text, std::size_t pos,
                          std::string_view prefix) {
  if (pos + prefix.size() > text.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i]) {
      return false;
    }
  }
  return true;
}

bool IsLinkChar(char ch) {
  const unsigned char uc = static_cast<unsigned char>(ch);
  if (uc <= 0x20 || uc == 0x7F) {
    return false;
  }
  return ch != '"' && ch != '<' && ch != '>' && ch != '`' && ch != '{' &&
         ch != '}' && ch != '|' && ch != '\\' && ch != '^';
}

bool IsTrailingPunct(char ch) {
  return ch == '.' || ch == ',' || ch == ';' || ch == ':' || ch == '!' ||
         ch == '?' || ch == '\'';
}

// Drops trailing punctuation and closing brackets that have no opening
// partner inside the link.
std::string_view TrimLink(std::string_view link) {
  while (!link.empty()) {
    const char last = link.back();
    if (IsTrailingPunct(last)) {
      link.remove_suffix(1);
      continue;
    }
    if (last == ')' || last == ']') {
      const char open = last == ')' ? '(' : '[';
      std::size_t opens = 0;
      std::size_t closes = 0;
      for (const char ch : link) {
        if (ch == open) {
          ++opens;
        } else if (ch == last) {
          ++closes;
        }
      }
      if (closes > opens) {
        link.remove_suffix(1);
        continue;
      }
    }
    break;
  }
  return link;
}

bool AtWordStart(std::string_view text, std::size_t pos) {
  if (pos == 0) {
    return true;
  }
  const unsigned char prev = static_cast<unsigned char>(text[pos - 1]);
  return std::isalnum(prev) == 0 && prev != '+' && prev != '-' && prev != '.';
}

}  // namespace

std::vector<std::string> ExtractDownloadableUrls(std::string_view text) {
  std::vector<std::string> urls;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::string_view matched;
    for (const auto scheme : kSchemes) {
      if (StartsWithIgnoreCase(text, pos, scheme) && AtWordStart(text, pos)) {
        matched = scheme;
        break;
      }
    }
    if (matched.empty()) {
      ++pos;
      continue;
    }
    std::size_t end = pos + matched.size();
    while (end < text.size() && IsLinkChar(text[end])) {
      ++end;
    }
    const std::string_view link = TrimLink(text.substr(pos, end - pos));
    if (link.size() > matched.size()) {
      std::string out(matched);
      out.append(link.substr(matched.size()));
      urls.push_back(std::move(out));
    }
    pos = end;
  }
  return urls;
}

}  // namespace sft::transfer
