// src/core/event_log.cpp
#include "core/event_log.hpp"
#include <iostream>

namespace ghg {

// Actor names and messages are untrusted; a raw line break would start a forged line.
static std::string escapeField(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      default:   out += c;
    }
  }
  return out;
}

void logEvent(const std::string& runId,
              const std::string& eventType,
              const std::map<std::string,std::string>& kv)
{
  std::cerr << "[EVENT][" << escapeField(eventType) << "] id="
            << (runId.empty() ? std::string("-") : escapeField(runId));
  for (auto& [k,v] : kv) std::cerr << " " << escapeField(k) << "=" << escapeField(v);
  std::cerr << "\n";
}

} // namespace ghg
