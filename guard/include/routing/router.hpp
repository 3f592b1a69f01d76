#pragma once
#include "core/types.hpp"
#include <string>

namespace ghg {

struct RoutingDecision {
  std::string handler; // "assign-agent", "request-info", "close-wontfix", ...
  std::string reason;  // "recommended" / "fallback"
};

// Decision only; executing it belongs to the action layer.
RoutingDecision routeTriage(const TriageResult& triage);

// "APPROVE" | "REQUEST_CHANGES" | "COMMENT"
const char* reviewEvent(Assessment a);

} // namespace ghg
