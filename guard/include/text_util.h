#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace ghg {

// Decoded code point; invalid sequences decode to kBadCodePoint with len 1
// so the original byte is preserved by callers that copy [pos, pos+len).
constexpr char32_t kBadCodePoint = 0xFFFFFFFF;

struct Utf8Unit {
  char32_t cp = kBadCodePoint;
  size_t len = 1;
};

Utf8Unit utf8At(const std::string& s, size_t pos);

size_t codePointCount(const std::string& s);

// Byte offset of the n-th code point (s.size() when s is shorter).
size_t byteOffsetOfCodePoint(const std::string& s, size_t n);

std::string truncateCodePoints(const std::string& s, size_t n);

// JavaScript-style \s: ASCII whitespace plus the Unicode space separators.
bool isSpaceCodePoint(char32_t cp);

// Collapse every whitespace run to one ' ' and trim both ends.
std::string collapseWhitespace(const std::string& s);

// Leading decimal integer after optional whitespace and sign ("42abc" -> 42).
// Saturates at the long long range instead of overflowing.
std::optional<long long> parseIntPrefix(const std::string& s);

} // namespace ghg
