#pragma once
#include "core/types.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace ghg {

enum class BreakerTrip { MaxIterations, MaxDepth, RepetitiveOutput, Timeout };

// "max-iterations" | "max-depth" | "repetitive-output" | "timeout"
const char* tripName(BreakerTrip t);

class CircuitBreakerError : public std::runtime_error {
public:
  CircuitBreakerError(BreakerTrip trip, const std::string& msg)
    : std::runtime_error(msg), trip_(trip) {}
  BreakerTrip trip() const { return trip_; }
private:
  BreakerTrip trip_;
};

CircuitBreakerContext makeContext(int dispatchDepth = 0, int iterationCount = 0);

// Throws CircuitBreakerError on the first violated bound, in this order:
// dispatch depth, iterations, repeated output.
void check(const CircuitBreakerContext& ctx, const BreakerLimits& limits = BreakerLimits{});

// New context: iteration +1, digest of `output` appended (oldest evicted past
// maxHashHistory), lastOutput = output.
CircuitBreakerContext update(const CircuitBreakerContext& ctx, const std::string& output,
                             const BreakerLimits& limits = BreakerLimits{});

CircuitBreakerContext incrementDispatchDepth(const CircuitBreakerContext& ctx);

// dispatch_depth from an inbound event payload; absent or unusable -> 0.
int parseDispatchDepth(const nlohmann::json& payload);

// `extra` plus dispatch_depth = depth + 1 and iteration_count.
nlohmann::json createDispatchPayload(const CircuitBreakerContext& ctx,
                                     const nlohmann::json& extra = nlohmann::json::object());

bool isBot(const std::string& username);
bool hasStopCommand(const std::string& text);

// Runs `fn` on a worker thread and waits at most `ms`. On expiry a Timeout
// trip is thrown; the worker is detached and its result discarded.
template <typename Fn>
auto withTimeout(Fn fn, uint32_t ms, const std::string& operationName)
    -> decltype(fn()) {
  using R = decltype(fn());
  auto prom = std::make_shared<std::promise<R>>();
  std::future<R> fut = prom->get_future();

  std::thread([prom, fn]() mutable {
    try {
      if constexpr (std::is_void_v<R>) {
        fn();
        prom->set_value();
      } else {
        prom->set_value(fn());
      }
    } catch (...) {
      prom->set_exception(std::current_exception());
    }
  }).detach();

  if (fut.wait_for(std::chrono::milliseconds(ms)) != std::future_status::ready) {
    throw CircuitBreakerError(BreakerTrip::Timeout,
      "Operation '" + operationName + "' timed out after " + std::to_string(ms) + "ms");
  }
  return fut.get();
}

} // namespace ghg
