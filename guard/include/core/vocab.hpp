#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace ghg {

// Coercions: lower-case, look up, otherwise the documented default.
Classification    parseClassification(const std::string& s);     // -> question
Priority          parsePriority(const std::string& s);           // -> medium
Severity          parseSeverity(const std::string& s);           // -> medium
Assessment        parseAssessment(const std::string& s);         // -> comment
RecommendedAction parseRecommendedAction(const std::string& s);  // -> human-review

const char* toString(Classification c);
const char* toString(Priority p);
const char* toString(Severity s);
const char* toString(Assessment a);
const char* toString(RecommendedAction a);

const std::vector<std::string>& allowedLabels();
bool isAllowedLabel(const std::string& label);

std::string toLowerAscii(std::string s);

} // namespace ghg
