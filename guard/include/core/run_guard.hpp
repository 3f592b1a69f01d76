#pragma once
#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ghg {

// External model provider. Implementations may block and may throw.
class IModelClient {
public:
  virtual ~IModelClient() = default;

  // Returns the raw completion text for one system/user prompt pair.
  virtual std::string complete(const std::string& systemPrompt,
                               const std::string& userPrompt) = 0;
};

struct Admission {
  bool proceed = true;
  std::string reason;   // "bot-actor" / "stop-command" when skipped
};

struct TriageOutcome {
  TriageResult result;
  CircuitBreakerContext context;   // after update()
  bool suspiciousInput = false;
};

struct ReviewOutcome {
  ReviewResult result;
  CircuitBreakerContext context;
  bool suspiciousInput = false;
};

// One guarded agent run: ingress sanitization, breaker, model call under a
// timeout, egress validation. Throws CircuitBreakerError when a bound trips.
class RunGuard {
public:
  explicit RunGuard(AppConfig cfg, std::string runId = "");

  Admission admit(const std::string& actor, const std::vector<std::string>& texts) const;

  TriageOutcome triage(const std::shared_ptr<IModelClient>& model,
                       const std::string& title, const std::string& body,
                       const CircuitBreakerContext& ctx) const;

  ReviewOutcome review(const std::shared_ptr<IModelClient>& model,
                       const std::string& title, const std::string& body,
                       const std::string& diff,
                       const CircuitBreakerContext& ctx) const;

  const AppConfig& config() const { return cfg_; }

private:
  std::string callModel(const std::shared_ptr<IModelClient>& model,
                        const std::string& systemPrompt,
                        const std::string& userPrompt,
                        const char* operation) const;

  AppConfig cfg_;
  std::string runId_;
};

} // namespace ghg
