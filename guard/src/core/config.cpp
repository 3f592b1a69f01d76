#include "core/config.hpp"
#include "core/vocab.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace ghg {

LogLevel parseLogLevel(const std::string& raw) {
  const std::string s = toLowerAscii(raw);
  if (s=="debug") return LogLevel::Debug;
  if (s=="info")  return LogLevel::Info;
  if (s=="warn" || s=="warning") return LogLevel::Warn;
  if (s=="error") return LogLevel::Error;
  return LogLevel::Info;
}

static std::string env(const char* key, const char* def = "") {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : std::string(def);
}

static bool parseFlag(const std::string& raw) {
  const std::string s = toLowerAscii(raw);
  return s=="1" || s=="true" || s=="yes";
}

// min(configured, current); non-positive values are ignored.
template <typename T>
static void tighten(const YAML::Node& n, const char* key, T& slot) {
  auto v = n[key];
  if (!v) return;
  long long want = v.as<long long>();
  if (want <= 0) {
    LOGW(std::string("config: breaker.") + key + " must be positive, keeping " + std::to_string(slot));
    return;
  }
  if ((unsigned long long)want > (unsigned long long)slot) {
    LOGW(std::string("config: breaker.") + key + " cannot be raised above " + std::to_string(slot));
    return;
  }
  slot = (T)want;
}

// max(configured, current). A shorter hash history weakens loop detection.
template <typename T>
static void widen(const YAML::Node& n, const char* key, T& slot) {
  auto v = n[key];
  if (!v) return;
  long long want = v.as<long long>();
  if (want <= 0 || (unsigned long long)want < (unsigned long long)slot) {
    LOGW(std::string("config: breaker.") + key + " cannot be lowered below " + std::to_string(slot));
    return;
  }
  if (want > 1000) want = 1000;
  slot = (T)want;
}

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    auto brk = root["breaker"];
    if (brk) {
      tighten(brk, "max_iterations",     outCfg.limits.maxIterations);
      tighten(brk, "max_dispatch_depth", outCfg.limits.maxDispatchDepth);
      widen(brk,   "max_hash_history",   outCfg.limits.maxHashHistory);
      tighten(brk, "model_timeout_ms",   outCfg.limits.modelTimeoutMs);
      tighten(brk, "api_timeout_ms",     outCfg.limits.apiTimeoutMs);
    }
    if (auto urls = root["urls"]) {
      if (auto ad = urls["allowed_domains"]) {
        outCfg.allowedDomains.clear();
        for (const auto& d : ad) outCfg.allowedDomains.push_back(d.as<std::string>());
      }
    }
    if (auto run = root["run"]) {
      outCfg.run.dryRun = run["dry_run"].as<bool>(outCfg.run.dryRun);
    }
    if (auto lg = root["log"]) {
      if (lg["level"]) outCfg.run.logLevel = parseLogLevel(lg["level"].as<std::string>("info"));
    }
    return true;
  } catch (const std::exception& ex) {
    err = path + ": " + ex.what();
    return false;
  }
}

bool loadConfigFromEnv(AppConfig& outCfg, std::string& err) {
  const std::string path = env("GHG_CONFIG");
  if (!path.empty() && !loadConfigYaml(path, outCfg, err)) return false;

  const std::string lvl = env("GHG_LOG_LEVEL");
  if (!lvl.empty()) outCfg.run.logLevel = parseLogLevel(lvl);

  const std::string dry = env("GHG_DRY_RUN");
  if (!dry.empty()) outCfg.run.dryRun = parseFlag(dry);
  return true;
}

} // namespace ghg
