#include "output_validator.h"
#include "core/vocab.hpp"
#include "log.h"
#include "sanitizer.h"
#include "text_util.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <unordered_set>

using nlohmann::json;

namespace ghg {

namespace {

const TextLimits kCaps{};

// JavaScript truthiness of a JSON value.
bool truthy(const json& v) {
  if (v.is_null())    return false;
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number())  return v.get<double>() != 0.0;
  if (v.is_string())  return !v.get_ref<const std::string&>().empty();
  return true;
}

// Scalar field as text; missing, falsy and non-scalar values give `def`.
std::string fieldText(const json& obj, const char* key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !truthy(*it)) return def;
  if (it->is_string())  return it->get<std::string>();
  if (it->is_boolean()) return "true";
  if (it->is_number_integer() || it->is_number_unsigned()) return it->dump();
  if (it->is_number_float()) {
    double d = it->get<double>();
    if (std::floor(d) == d && std::fabs(d) < 1e15) return std::to_string((long long)d);
    return it->dump();
  }
  return def;
}

std::optional<int> positiveInt(long long v) {
  if (v <= 0 || v > INT_MAX) return std::nullopt;
  return (int)v;
}

// Positive integer from a number or a numeric string ("12", " 12abc").
std::optional<int> parsePositiveRef(const json& v) {
  if (v.is_number_integer()) return positiveInt(v.get<long long>());
  if (v.is_number_unsigned()) {
    auto u = v.get<unsigned long long>();
    return u > (unsigned long long)INT_MAX ? std::nullopt : positiveInt((long long)u);
  }
  if (v.is_number_float()) {
    double d = v.get<double>();
    if (!(d >= 1.0) || d > (double)INT_MAX) return std::nullopt;
    return (int)std::trunc(d);
  }
  if (v.is_string()) {
    auto n = parseIntPrefix(v.get<std::string>());
    if (!n) return std::nullopt;
    return positiveInt(*n);
  }
  return std::nullopt;
}

// Line numbers are only taken from JSON numbers.
std::optional<int> parseLine(const json& obj) {
  auto it = obj.find("line");
  if (it == obj.end() || !it->is_number()) return std::nullopt;
  if (it->is_number_float()) {
    double d = it->get<double>();
    if (!(d > 0.0) || d >= (double)INT_MAX + 1.0) return std::nullopt;
    int f = (int)std::floor(d);
    return f > 0 ? std::optional<int>(f) : std::nullopt;
  }
  return parsePositiveRef(*it);
}

std::vector<std::string> filterLabels(const json& obj) {
  std::vector<std::string> out;
  auto it = obj.find("labels");
  if (it == obj.end() || !it->is_array()) return out;
  std::unordered_set<std::string> seen;
  for (const auto& l : *it) {
    if (!l.is_string()) continue;
    std::string lower = toLowerAscii(l.get<std::string>());
    if (!isAllowedLabel(lower)) {
      LOGD("validator: dropping label outside the allow-list");
      continue;
    }
    if (seen.insert(lower).second) out.push_back(std::move(lower));
  }
  return out;
}

std::vector<std::string> injectionFlags(const json& obj) {
  std::vector<std::string> out;
  auto it = obj.find("injectionFlagsDetected");
  if (it == obj.end() || !it->is_array()) return out;
  for (const auto& f : *it) {
    if (!f.is_string()) continue;
    const auto& s = f.get_ref<const std::string&>();
    if (codePointCount(s) < 100) out.push_back(s);
  }
  return out;
}

std::vector<ReviewIssue> validateIssueArray(const json& obj, const char* key) {
  std::vector<ReviewIssue> out;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_array()) return out;

  const size_t n = std::min(it->size(), kCaps.maxIssues);
  for (size_t i = 0; i < n; ++i) {
    const json& item = (*it)[i];
    if (!item.is_object()) continue;
    ReviewIssue issue;
    issue.severity    = parseSeverity(fieldText(item, "severity", "medium"));
    issue.file        = sanitizeFilePath(fieldText(item, "file", "unknown"));
    issue.line        = parseLine(item);
    issue.description = sanitizeTextField(fieldText(item, "description", ""), kCaps.description);
    std::string sugg  = fieldText(item, "suggestion", "");
    if (!sugg.empty()) issue.suggestion = sanitizeTextField(sugg, kCaps.suggestion);
    out.push_back(std::move(issue));
  }
  return out;
}

std::vector<ReviewSuggestion> validateSuggestionArray(const json& obj) {
  std::vector<ReviewSuggestion> out;
  auto it = obj.find("suggestions");
  if (it == obj.end() || !it->is_array()) return out;

  const size_t n = std::min(it->size(), kCaps.maxSuggestions);
  for (size_t i = 0; i < n; ++i) {
    const json& item = (*it)[i];
    if (!item.is_object()) continue;
    ReviewSuggestion s;
    s.file       = sanitizeFilePath(fieldText(item, "file", "unknown"));
    s.line       = parseLine(item);
    s.suggestion = sanitizeTextField(fieldText(item, "suggestion", ""), kCaps.suggestion);
    s.rationale  = sanitizeTextField(fieldText(item, "rationale", ""), kCaps.reasoning);
    out.push_back(std::move(s));
  }
  return out;
}

// Parses raw model text into a JSON object; the failure reason goes to `err`.
bool parseModelObject(const std::string& raw, json& out, std::string& err) {
  out = json::parse(extractJsonPayload(raw), nullptr, false);
  if (out.is_discarded()) { err = "Failed to parse LLM output as JSON"; return false; }
  if (!out.is_object())   { err = "LLM output is not a JSON object"; return false; }
  return true;
}

bool isTrimSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trimAscii(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && isTrimSpace(s[b])) ++b;
  while (e > b && isTrimSpace(s[e-1])) --e;
  return s.substr(b, e - b);
}

bool startsWithDrive(const std::string& s) {
  return s.size() >= 2 && std::isalpha((unsigned char)s[0]) && s[1] == ':';
}

bool isSep(char c) { return c == '/' || c == '\\'; }

std::string sanitizePathOnce(std::string s) {
  // X: or X:/ X:\ prefix
  if (startsWithDrive(s)) s.erase(0, (s.size() > 2 && isSep(s[2])) ? 3 : 2);

  // \\host\ or //host/ prefix
  if (s.size() >= 2 && isSep(s[0]) && isSep(s[1])) {
    size_t i = 0;
    while (i < s.size() && isSep(s[i])) ++i;
    size_t hostEnd = i;
    while (hostEnd < s.size() && !isSep(s[hostEnd])) ++hostEnd;
    if (hostEnd > i) s.erase(0, hostEnd < s.size() ? hostEnd + 1 : hostEnd);
  }

  std::replace(s.begin(), s.end(), '\\', '/');

  std::string noDots; noDots.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '.' && i + 1 < s.size() && s[i+1] == '.') { ++i; continue; }
    noDots.push_back(s[i]);
  }

  std::string out; out.reserve(noDots.size());
  for (char c : noDots) {
    if (c == '/' && !out.empty() && out.back() == '/') continue;
    out.push_back(c);
  }

  size_t lead = 0;
  while (lead < out.size() && out[lead] == '/') ++lead;
  return out.substr(lead);
}

} // namespace

std::string extractJsonPayload(const std::string& raw) {
  const size_t open = raw.find("```");
  if (open != std::string::npos) {
    size_t start = open + 3;
    if (raw.compare(start, 4, "json") == 0) start += 4;
    const size_t close = raw.find("```", start);
    if (close != std::string::npos) return trimAscii(raw.substr(start, close - start));
  }
  return trimAscii(raw);
}

std::string sanitizeFilePath(const std::string& path) {
  // Each pass can expose a new prefix (e.g. "C..:/x" -> "C:/x"); run to a fixed point.
  std::string cur = path;
  while (true) {
    std::string next = sanitizePathOnce(cur);
    if (next == cur) break;
    cur.swap(next);
  }
  cur = truncateCodePoints(cur, kCaps.filePath);
  return cur.empty() ? "unknown" : cur;
}

std::string sanitizeTextField(const std::string& text, size_t maxLength) {
  std::string s = collapseWhitespace(stripShellMetacharacters(text));
  if (codePointCount(s) > maxLength) {
    s = truncateCodePoints(s, maxLength >= 3 ? maxLength - 3 : 0) + "...";
  }
  return s;
}

TriageResult defaultTriageResult(const std::string& reason) {
  TriageResult r;
  r.classification = Classification::Question;
  r.labels = {"needs-human-review"};
  r.priority = Priority::Medium;
  r.summary = reason;
  r.reasoning = "Automatic fallback due to processing error";
  r.needsHumanReview = true;
  r.isActionable = false;
  r.actionabilityReason = "Unable to assess due to processing error";
  r.alignsWithVision = true;
  r.visionAlignmentReason = "Unable to assess due to processing error";
  r.recommendedAction = RecommendedAction::HumanReview;
  return r;
}

ReviewResult defaultReviewResult(const std::string& reason) {
  ReviewResult r;
  r.overallAssessment = Assessment::Comment;
  r.summary = reason;
  return r;
}

TriageResult validateTriageOutput(const std::string& raw) {
  json parsed; std::string err;
  if (!parseModelObject(raw, parsed, err)) {
    LOGW("validator: triage output rejected (" + err + "), forcing human review");
    return defaultTriageResult(err);
  }
  return validateTriageObject(parsed);
}

TriageResult validateTriageObject(const json& parsed) {
  if (!parsed.is_object()) {
    LOGW("validator: triage output is not an object, forcing human review");
    return defaultTriageResult("LLM output is not a JSON object");
  }

  TriageResult r;
  r.classification = parseClassification(fieldText(parsed, "classification", "question"));
  r.labels         = filterLabels(parsed);
  r.priority       = parsePriority(fieldText(parsed, "priority", "medium"));
  r.summary        = sanitizeTextField(fieldText(parsed, "summary", ""), kCaps.summary);
  r.reasoning      = sanitizeTextField(fieldText(parsed, "reasoning", ""), kCaps.reasoning);

  auto dup = parsed.find("duplicateOf");
  if (dup != parsed.end() && !dup->is_null()) r.duplicateOf = parsePositiveRef(*dup);

  r.needsHumanReview = parsed.contains("needsHumanReview") && truthy(parsed["needsHumanReview"]);
  r.isActionable     = parsed.contains("isActionable") && truthy(parsed["isActionable"]);
  {
    auto it = parsed.find("alignsWithVision");
    r.alignsWithVision = !(it != parsed.end() && it->is_boolean() && !it->get<bool>());
  }
  r.actionabilityReason   = sanitizeTextField(fieldText(parsed, "actionabilityReason", ""), kCaps.reasoning);
  r.visionAlignmentReason = sanitizeTextField(fieldText(parsed, "visionAlignmentReason", ""), kCaps.reasoning);
  r.recommendedAction     = parseRecommendedAction(fieldText(parsed, "recommendedAction", "human-review"));
  r.injectionFlagsDetected = injectionFlags(parsed);
  return r;
}

ReviewResult validateReviewOutput(const std::string& raw) {
  json parsed; std::string err;
  if (!parseModelObject(raw, parsed, err)) {
    LOGW("validator: review output rejected (" + err + "), falling back to comment");
    return defaultReviewResult(err);
  }
  return validateReviewObject(parsed);
}

ReviewResult validateReviewObject(const json& parsed) {
  if (!parsed.is_object()) {
    LOGW("validator: review output is not an object, falling back to comment");
    return defaultReviewResult("LLM output is not a JSON object");
  }

  ReviewResult r;
  r.overallAssessment = parseAssessment(fieldText(parsed, "overallAssessment", "comment"));
  r.securityIssues    = validateIssueArray(parsed, "securityIssues");
  r.codeQualityIssues = validateIssueArray(parsed, "codeQualityIssues");
  r.suggestions       = validateSuggestionArray(parsed);
  r.summary           = sanitizeTextField(fieldText(parsed, "summary", ""), kCaps.summary);
  return r;
}

} // namespace ghg
