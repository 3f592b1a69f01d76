#include "injection_scan.h"
#include "text_util.h"
#include <cctype>
#include <regex>

namespace ghg {

namespace {

struct PatternEntry {
  const char* tag;
  const char* anchor;   // cheap substring gate before the regex runs
  std::regex  re;
};

std::regex rx(const char* pattern) {
  return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

// Matched against the scan view: ASCII lower-cased, whitespace runs folded to one space.
const std::vector<PatternEntry>& table() {
  static const std::vector<PatternEntry> t = {
    {"ignore-instructions", "ignore",
      rx(R"(ignore\s+(previous|prior|above|all)\s+(instructions?|prompts?|rules?))")},
    {"disregard-previous", "disregard",
      rx(R"(disregard\s+(previous|prior|above|all))")},
    {"system-prompt-reference", "system",
      rx(R"(system\s*prompt)")},
    {"role-override", "you",
      rx(R"(you\s+are\s+now)")},
    {"fake-important", "important",
      rx(R"(important\s+(instruction|note|update|override))")},
    {"execute-command", "execute",
      rx(R"(execute\s+(the\s+following|this\s+command))")},
    {"fake-system-block", "---",
      rx(R"(---\s*begin\s+(system|admin|root))")},
    {"authority-claim", "maintainer",
      rx(R"(as\s+(the|a)\s+(project\s+)?maintainer)")},
    {"admin-override", "override",
      rx(R"(admin(istrator)?\s+override)")},
    {"bypass-attempt", "bypass",
      rx(R"(bypass\s+(security|filter|check))")},
    {"pwned-marker", "",
      rx(R"(\bpwned\b|\bhacked\b)")},
    {"encoding-attempt", "",
      rx(R"(base64\s*decode|atob\s*\()")},
  };
  return t;
}

std::string scanView(const std::string& text) {
  std::string v; v.reserve(text.size());
  bool inSpace = false;
  for (size_t i = 0; i < text.size();) {
    Utf8Unit u = utf8At(text, i);
    if (u.cp != kBadCodePoint && isSpaceCodePoint(u.cp)) {
      if (!inSpace) v.push_back(' ');
      inSpace = true;
    } else {
      inSpace = false;
      if (u.len == 1) v.push_back((char)std::tolower((unsigned char)text[i]));
      else v.append(text, i, u.len);
    }
    i += u.len;
  }
  return v;
}

} // namespace

std::vector<std::string> scanInjectionPatterns(const std::string& text) {
  std::vector<std::string> tags;
  if (text.empty()) return tags;
  const std::string view = scanView(text);
  for (const auto& p : table()) {
    if (*p.anchor && view.find(p.anchor) == std::string::npos) continue;
    if (std::regex_search(view, p.re)) tags.emplace_back(p.tag);
  }
  return tags;
}

std::vector<std::string> injectionPatternTags() {
  std::vector<std::string> tags;
  for (const auto& p : table()) tags.emplace_back(p.tag);
  return tags;
}

} // namespace ghg
