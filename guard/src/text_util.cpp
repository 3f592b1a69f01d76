#include "text_util.h"
#include <cctype>
#include <limits>

namespace ghg {

Utf8Unit utf8At(const std::string& s, size_t pos) {
  Utf8Unit u;
  const auto b0 = (unsigned char)s[pos];
  if (b0 < 0x80) { u.cp = b0; return u; }

  size_t need = 0; char32_t cp = 0; char32_t minCp = 0;
  if      ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; minCp = 0x80; }
  else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; minCp = 0x800; }
  else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; minCp = 0x10000; }
  else return u;

  if (pos + need >= s.size()) return u;
  for (size_t k = 1; k <= need; ++k) {
    const auto b = (unsigned char)s[pos + k];
    if ((b & 0xC0) != 0x80) return u;
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return u;
  u.cp = cp; u.len = need + 1;
  return u;
}

size_t codePointCount(const std::string& s) {
  size_t n = 0;
  for (size_t i = 0; i < s.size(); i += utf8At(s, i).len) ++n;
  return n;
}

size_t byteOffsetOfCodePoint(const std::string& s, size_t n) {
  size_t i = 0;
  while (i < s.size() && n > 0) { i += utf8At(s, i).len; --n; }
  return i;
}

std::string truncateCodePoints(const std::string& s, size_t n) {
  return s.substr(0, byteOffsetOfCodePoint(s, n));
}

bool isSpaceCodePoint(char32_t cp) {
  switch (cp) {
    case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
    case 0xA0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
    case 0x205F: case 0x3000: case 0xFEFF:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

std::string collapseWhitespace(const std::string& s) {
  std::string out; out.reserve(s.size());
  bool pendingSpace = false;
  for (size_t i = 0; i < s.size();) {
    Utf8Unit u = utf8At(s, i);
    if (u.cp != kBadCodePoint && isSpaceCodePoint(u.cp)) {
      pendingSpace = !out.empty();
    } else {
      if (pendingSpace) { out.push_back(' '); pendingSpace = false; }
      out.append(s, i, u.len);
    }
    i += u.len;
  }
  return out;
}

std::optional<long long> parseIntPrefix(const std::string& s) {
  size_t i = 0;
  while (i < s.size()) {
    Utf8Unit u = utf8At(s, i);
    if (u.cp == kBadCodePoint || !isSpaceCodePoint(u.cp)) break;
    i += u.len;
  }
  bool neg = false;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) { neg = s[i] == '-'; ++i; }
  if (i >= s.size() || !std::isdigit((unsigned char)s[i])) return std::nullopt;

  const long long lim = std::numeric_limits<long long>::max();
  long long v = 0;
  for (; i < s.size() && std::isdigit((unsigned char)s[i]); ++i) {
    int d = s[i] - '0';
    if (v > (lim - d) / 10) { v = lim; continue; }
    v = v * 10 + d;
  }
  return neg ? -v : v;
}

} // namespace ghg
