#include "circuit_breaker.h"
#include "core/vocab.hpp"
#include "hash_sha256.h"
#include "log.h"
#include "text_util.h"

#include <algorithm>
#include <climits>
#include <cmath>

using nlohmann::json;

namespace ghg {

namespace {

const char* const kBotAccounts[] = {
  "github-actions", "github-actions[bot]",
  "dependabot", "dependabot[bot]",
  "renovate", "renovate[bot]",
  "codecov", "codecov[bot]",
  "greenkeeper", "greenkeeper[bot]",
  "copilot-swe-agent",
  "snyk-bot",
};

const char* const kStopCommands[] = { "/stop", "/override", "/human", "/halt", "/cancel" };

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int clampDepth(long long v) {
  if (v < 0) return 0;
  return v > INT_MAX ? INT_MAX : (int)v;
}

} // namespace

const char* tripName(BreakerTrip t) {
  switch (t) {
    case BreakerTrip::MaxIterations:    return "max-iterations";
    case BreakerTrip::MaxDepth:         return "max-depth";
    case BreakerTrip::RepetitiveOutput: return "repetitive-output";
    case BreakerTrip::Timeout:          return "timeout";
  }
  return "unknown";
}

CircuitBreakerContext makeContext(int dispatchDepth, int iterationCount) {
  CircuitBreakerContext ctx;
  ctx.dispatchDepth  = std::max(0, dispatchDepth);
  ctx.iterationCount = std::max(0, iterationCount);
  return ctx;
}

void check(const CircuitBreakerContext& ctx, const BreakerLimits& limits) {
  if (ctx.dispatchDepth >= limits.maxDispatchDepth) {
    throw CircuitBreakerError(BreakerTrip::MaxDepth,
      "Maximum dispatch depth (" + std::to_string(limits.maxDispatchDepth) + ") reached");
  }
  if (ctx.iterationCount >= limits.maxIterations) {
    throw CircuitBreakerError(BreakerTrip::MaxIterations,
      "Maximum iterations (" + std::to_string(limits.maxIterations) + ") reached");
  }
  if (ctx.lastOutput && ctx.recentOutputHashes.size() > 1) {
    const std::string digest = short_digest(*ctx.lastOutput);
    // the newest entry is lastOutput's own digest
    auto prevEnd = ctx.recentOutputHashes.end() - 1;
    if (std::find(ctx.recentOutputHashes.begin(), prevEnd, digest) != prevEnd) {
      throw CircuitBreakerError(BreakerTrip::RepetitiveOutput,
        "Detected repetitive output (hash " + digest + ")");
    }
  }
}

CircuitBreakerContext update(const CircuitBreakerContext& ctx, const std::string& output,
                             const BreakerLimits& limits) {
  CircuitBreakerContext next = ctx;
  if (next.iterationCount < INT_MAX) ++next.iterationCount;
  next.recentOutputHashes.push_back(short_digest(output));
  while (next.recentOutputHashes.size() > limits.maxHashHistory) next.recentOutputHashes.pop_front();
  next.lastOutput = output;
  return next;
}

CircuitBreakerContext incrementDispatchDepth(const CircuitBreakerContext& ctx) {
  CircuitBreakerContext next = ctx;
  if (next.dispatchDepth < INT_MAX) ++next.dispatchDepth;
  return next;
}

int parseDispatchDepth(const json& payload) {
  if (!payload.is_object()) return 0;
  auto it = payload.find("dispatch_depth");
  if (it == payload.end()) return 0;

  if (it->is_number_unsigned()) {
    auto u = it->get<unsigned long long>();
    return u > (unsigned long long)INT_MAX ? INT_MAX : (int)u;
  }
  if (it->is_number_integer()) return clampDepth(it->get<long long>());
  if (it->is_number_float()) {
    double d = it->get<double>();
    if (!(d >= 0.0)) return 0;   // negative or NaN
    if (d >= (double)INT_MAX) return INT_MAX;
    return (int)std::floor(d);
  }
  if (it->is_string()) {
    auto n = parseIntPrefix(it->get<std::string>());
    if (!n) {
      LOGW("breaker: unusable dispatch_depth, assuming 0");
      return 0;
    }
    return clampDepth(*n);
  }
  return 0;
}

json createDispatchPayload(const CircuitBreakerContext& ctx, const json& extra) {
  json out = extra.is_object() ? extra : json::object();
  out["dispatch_depth"]  = ctx.dispatchDepth < INT_MAX ? ctx.dispatchDepth + 1 : INT_MAX;
  out["iteration_count"] = ctx.iterationCount;
  return out;
}

bool isBot(const std::string& username) {
  const std::string lower = toLowerAscii(username);
  if (endsWith(lower, "[bot]")) return true;
  for (const char* b : kBotAccounts) {
    if (lower == b) return true;
  }
  return false;
}

bool hasStopCommand(const std::string& text) {
  const std::string lower = toLowerAscii(text);
  for (const char* cmd : kStopCommands) {
    if (lower.find(cmd) != std::string::npos) return true;
  }
  return false;
}

} // namespace ghg
