#pragma once
#include <string>
#include <vector>

namespace ghg {

// Detection only: returns the tags of every table entry that matches `text`,
// in table order. Never modifies the input.
std::vector<std::string> scanInjectionPatterns(const std::string& text);

// All tags the table can produce, in table order.
std::vector<std::string> injectionPatternTags();

} // namespace ghg
