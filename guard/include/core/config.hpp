#pragma once
#include "types.hpp"
#include "log.h"
#include <string>
#include <vector>

namespace ghg {

struct RunConfig {
  bool dryRun = false;
  LogLevel logLevel = LogLevel::Info;
};

struct AppConfig {
  BreakerLimits limits;
  std::vector<std::string> allowedDomains;
  RunConfig run;
};

// Reads a YAML file into outCfg. Breaker values can only tighten the
// built-in limits. Returns false with `err` set when the file is unusable.
bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err);

// Defaults, then the file named by GHG_CONFIG, then GHG_LOG_LEVEL / GHG_DRY_RUN.
bool loadConfigFromEnv(AppConfig& outCfg, std::string& err);

} // namespace ghg
