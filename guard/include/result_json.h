#pragma once
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ghg {

// camelCase keys, matching the model's response schema
nlohmann::json toJson(const SanitizeResult& r);
nlohmann::json toJson(const TriageResult& r);
nlohmann::json toJson(const ReviewIssue& i);
nlohmann::json toJson(const ReviewSuggestion& s);
nlohmann::json toJson(const ReviewResult& r);

// Pretty-printed output text. Invalid UTF-8 kept by the sanitizer becomes U+FFFD
// instead of throwing.
std::string toOutputText(const nlohmann::json& j);

} // namespace ghg
