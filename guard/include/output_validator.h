#pragma once
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ghg {

// Egress validation of model output. None of these throw: any parse or
// schema failure yields the conservative "needs a human" default.
TriageResult validateTriageOutput(const std::string& raw);
TriageResult validateTriageObject(const nlohmann::json& parsed);
ReviewResult validateReviewOutput(const std::string& raw);
ReviewResult validateReviewObject(const nlohmann::json& parsed);

TriageResult defaultTriageResult(const std::string& reason);
ReviewResult defaultReviewResult(const std::string& reason);

// Body of the first ``` / ```json fenced block, or the whole input.
std::string extractJsonPayload(const std::string& raw);

// Relative, traversal-free, at most 256 code points; "unknown" when empty.
std::string sanitizeFilePath(const std::string& path);

// Shell metacharacters removed, whitespace collapsed, capped at maxLength
// code points ("..." included) when too long.
std::string sanitizeTextField(const std::string& text, size_t maxLength);

template <typename T = nlohmann::json>
std::optional<T> safeParseJson(const std::string& text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  try {
    return j.get<T>();
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

} // namespace ghg
