#include "core/vocab.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace ghg {

namespace {

template <typename E, size_t N>
E lookup(const std::pair<const char*, E> (&table)[N], const std::string& raw, E def) {
  const std::string s = toLowerAscii(raw);
  for (const auto& kv : table) if (s == kv.first) return kv.second;
  return def;
}

template <typename E, size_t N>
const char* nameOf(const std::pair<const char*, E> (&table)[N], E v) {
  for (const auto& kv : table) if (kv.second == v) return kv.first;
  return table[0].first;
}

const std::pair<const char*, Classification> kClassifications[] = {
  {"bug", Classification::Bug},
  {"feature", Classification::Feature},
  {"question", Classification::Question},
  {"documentation", Classification::Documentation},
  {"spam", Classification::Spam},
};

const std::pair<const char*, Priority> kPriorities[] = {
  {"low", Priority::Low},
  {"medium", Priority::Medium},
  {"high", Priority::High},
  {"critical", Priority::Critical},
};

const std::pair<const char*, Severity> kSeverities[] = {
  {"critical", Severity::Critical},
  {"high", Severity::High},
  {"medium", Severity::Medium},
  {"low", Severity::Low},
};

const std::pair<const char*, Assessment> kAssessments[] = {
  {"approve", Assessment::Approve},
  {"request-changes", Assessment::RequestChanges},
  {"comment", Assessment::Comment},
};

const std::pair<const char*, RecommendedAction> kActions[] = {
  {"assign-to-agent", RecommendedAction::AssignToAgent},
  {"request-clarification", RecommendedAction::RequestClarification},
  {"close-as-wontfix", RecommendedAction::CloseAsWontfix},
  {"close-as-duplicate", RecommendedAction::CloseAsDuplicate},
  {"human-review", RecommendedAction::HumanReview},
};

} // namespace

std::string toLowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

Classification parseClassification(const std::string& s) {
  return lookup(kClassifications, s, Classification::Question);
}
Priority parsePriority(const std::string& s) {
  return lookup(kPriorities, s, Priority::Medium);
}
Severity parseSeverity(const std::string& s) {
  return lookup(kSeverities, s, Severity::Medium);
}
Assessment parseAssessment(const std::string& s) {
  return lookup(kAssessments, s, Assessment::Comment);
}
RecommendedAction parseRecommendedAction(const std::string& s) {
  return lookup(kActions, s, RecommendedAction::HumanReview);
}

const char* toString(Classification c)    { return nameOf(kClassifications, c); }
const char* toString(Priority p)          { return nameOf(kPriorities, p); }
const char* toString(Severity s)          { return nameOf(kSeverities, s); }
const char* toString(Assessment a)        { return nameOf(kAssessments, a); }
const char* toString(RecommendedAction a) { return nameOf(kActions, a); }

const std::vector<std::string>& allowedLabels() {
  static const std::vector<std::string> labels = {
    "bug", "feature", "question", "documentation", "good-first-issue",
    "needs-human-review", "duplicate", "wontfix", "performance", "breaking-change",
    "security", "enhancement", "help-wanted",
    "status:triage", "status:needs-info", "status:spec-ready", "status:ready-for-dev",
    "status:in-progress", "status:blocked",
    "priority:low", "priority:medium", "priority:high", "priority:critical",
    "copilot-assigned", "agent-assigned", "ready-for-agent", "assigned-to-agent",
    "agent-coded", "ready-for-research", "has-sub-issues", "triaged", "stale",
    "research-report",
  };
  return labels;
}

bool isAllowedLabel(const std::string& label) {
  static const std::unordered_set<std::string> index(allowedLabels().begin(), allowedLabels().end());
  return index.count(label) != 0;
}

} // namespace ghg
