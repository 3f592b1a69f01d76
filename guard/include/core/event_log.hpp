#pragma once
#include <map>
#include <string>

namespace ghg {

// One "[EVENT][type] id=<run> k=v ..." line on stderr. Keys print sorted;
// backslash, CR and LF in any field are escaped.
void logEvent(const std::string& runId,
              const std::string& eventType,
              const std::map<std::string,std::string>& kv);

} // namespace ghg
