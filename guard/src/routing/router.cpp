// src/routing/router.cpp
#include "routing/router.hpp"

namespace ghg {

RoutingDecision routeTriage(const TriageResult& triage) {
  RoutingDecision rd{};
  rd.reason = "recommended";

  switch (triage.recommendedAction) {
    case RecommendedAction::AssignToAgent:
      rd.handler = "assign-agent";
      return rd;
    case RecommendedAction::RequestClarification:
      rd.handler = "request-info";
      return rd;
    case RecommendedAction::CloseAsWontfix:
      rd.handler = "close-wontfix";
      return rd;
    case RecommendedAction::CloseAsDuplicate:
      if (triage.duplicateOf) {
        rd.handler = "close-duplicate";
        return rd;
      }
      // nothing to point the duplicate at
      rd.handler = "human-review";
      rd.reason  = "fallback";
      return rd;
    case RecommendedAction::HumanReview:
      break;
  }

  rd.handler = "human-review";
  return rd;
}

const char* reviewEvent(Assessment a) {
  switch (a) {
    case Assessment::Approve:        return "APPROVE";
    case Assessment::RequestChanges: return "REQUEST_CHANGES";
    case Assessment::Comment:        return "COMMENT";
  }
  return "COMMENT";
}

} // namespace ghg
