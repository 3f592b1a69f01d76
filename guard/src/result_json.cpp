#include "result_json.h"
#include "core/vocab.hpp"

using nlohmann::json;

namespace ghg {

template <typename T>
static json optionalJson(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

json toJson(const SanitizeResult& r) {
  json j;
  j["sanitizedText"]       = r.sanitizedText;
  j["detectedPatternTags"] = r.detectedPatternTags;
  j["wasModified"]         = r.wasModified;
  j["warningPrefix"]       = optionalJson(r.warningPrefix);
  return j;
}

json toJson(const TriageResult& r) {
  json j;
  j["classification"]         = toString(r.classification);
  j["labels"]                 = r.labels;
  j["priority"]               = toString(r.priority);
  j["summary"]                = r.summary;
  j["reasoning"]              = r.reasoning;
  j["duplicateOf"]            = optionalJson(r.duplicateOf);
  j["needsHumanReview"]       = r.needsHumanReview;
  j["injectionFlagsDetected"] = r.injectionFlagsDetected;
  j["isActionable"]           = r.isActionable;
  j["actionabilityReason"]    = r.actionabilityReason;
  j["alignsWithVision"]       = r.alignsWithVision;
  j["visionAlignmentReason"]  = r.visionAlignmentReason;
  j["recommendedAction"]      = toString(r.recommendedAction);
  return j;
}

json toJson(const ReviewIssue& i) {
  json j;
  j["severity"]    = toString(i.severity);
  j["file"]        = i.file;
  j["line"]        = optionalJson(i.line);
  j["description"] = i.description;
  if (i.suggestion) j["suggestion"] = *i.suggestion;
  return j;
}

json toJson(const ReviewSuggestion& s) {
  json j;
  j["file"]       = s.file;
  j["line"]       = optionalJson(s.line);
  j["suggestion"] = s.suggestion;
  j["rationale"]  = s.rationale;
  return j;
}

json toJson(const ReviewResult& r) {
  json j;
  j["overallAssessment"] = toString(r.overallAssessment);
  j["securityIssues"]    = json::array();
  for (const auto& i : r.securityIssues) j["securityIssues"].push_back(toJson(i));
  j["codeQualityIssues"] = json::array();
  for (const auto& i : r.codeQualityIssues) j["codeQualityIssues"].push_back(toJson(i));
  j["suggestions"] = json::array();
  for (const auto& s : r.suggestions) j["suggestions"].push_back(toJson(s));
  j["summary"] = r.summary;
  return j;
}

std::string toOutputText(const json& j) {
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace ghg
