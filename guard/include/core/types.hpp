#pragma once
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace ghg {

enum class Classification { Bug, Feature, Question, Documentation, Spam };
enum class Priority       { Low, Medium, High, Critical };
enum class Severity       { Critical, High, Medium, Low };
enum class Assessment     { Approve, RequestChanges, Comment };
enum class RecommendedAction {
  AssignToAgent, RequestClarification, CloseAsWontfix, CloseAsDuplicate, HumanReview
};

// Fixed run bounds. Configuration may lower these, never raise them.
struct BreakerLimits {
  int      maxIterations    = 5;
  int      maxDispatchDepth = 3;
  size_t   maxHashHistory   = 10;
  uint32_t modelTimeoutMs   = 120000;
  uint32_t apiTimeoutMs     = 30000;
};

// Per-field caps for free text coming back from the model
struct TextLimits {
  size_t summary     = 2000;
  size_t reasoning   = 1000;
  size_t description = 500;
  size_t suggestion  = 500;
  size_t filePath    = 256;
  size_t maxIssues      = 50;
  size_t maxSuggestions = 20;
};

struct SanitizeResult {
  std::string sanitizedText;
  std::vector<std::string> detectedPatternTags;   // insertion order
  bool wasModified = false;
  std::optional<std::string> warningPrefix;
};

struct SanitizedIssue {
  SanitizeResult title;
  SanitizeResult body;
  bool hasSuspiciousContent = false;
};

struct TriageResult {
  Classification classification = Classification::Question;
  std::vector<std::string> labels;
  Priority priority = Priority::Medium;
  std::string summary;
  std::string reasoning;
  std::optional<int> duplicateOf;
  bool needsHumanReview = false;
  std::vector<std::string> injectionFlagsDetected;
  bool isActionable = false;
  std::string actionabilityReason;
  bool alignsWithVision = true;
  std::string visionAlignmentReason;
  RecommendedAction recommendedAction = RecommendedAction::HumanReview;
};

struct ReviewIssue {
  Severity severity = Severity::Medium;
  std::string file;
  std::optional<int> line;
  std::string description;
  std::optional<std::string> suggestion;
};

struct ReviewSuggestion {
  std::string file;
  std::optional<int> line;
  std::string suggestion;
  std::string rationale;
};

struct ReviewResult {
  Assessment overallAssessment = Assessment::Comment;
  std::vector<ReviewIssue> securityIssues;
  std::vector<ReviewIssue> codeQualityIssues;
  std::vector<ReviewSuggestion> suggestions;
  std::string summary;
};

// Threaded by value through the breaker transitions; never shared.
struct CircuitBreakerContext {
  int dispatchDepth = 0;
  int iterationCount = 0;
  std::deque<std::string> recentOutputHashes;
  std::optional<std::string> lastOutput;
};

} // namespace ghg
// types.hpp defines the value types crossing the trust boundary: sanitizer results, validated model results and breaker state.
