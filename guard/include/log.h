#pragma once
#include <cstdio>
#include <ctime>
#include <string>

namespace ghg {

enum class LogLevel { Debug=0, Info=1, Warn=2, Error=3 };

inline LogLevel& log_threshold() {
  static LogLevel lvl = LogLevel::Info;
  return lvl;
}

// "debug" | "info" | "warn" | "error"; anything else -> info
LogLevel parseLogLevel(const std::string& s);

inline void _log_emit(LogLevel lvl, const char* tag, const std::string& msg){
  if (lvl < log_threshold()) return;
  std::time_t now = std::time(nullptr);
  std::tm tm{}; localtime_r(&now, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(stderr, "[%s] %s | %s\n", tag, ts, msg.c_str());
}

} // namespace ghg

#define LOGD(m) ::ghg::_log_emit(::ghg::LogLevel::Debug, "DEBUG", (m))
#define LOGI(m) ::ghg::_log_emit(::ghg::LogLevel::Info,  "INFO ", (m))
#define LOGW(m) ::ghg::_log_emit(::ghg::LogLevel::Warn,  "WARN ", (m))
#define LOGE(m) ::ghg::_log_emit(::ghg::LogLevel::Error, "ERROR", (m))
