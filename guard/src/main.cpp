#include "circuit_breaker.h"
#include "core/config.hpp"
#include "core/event_log.hpp"
#include "log.h"
#include "output_validator.h"
#include "result_json.h"
#include "sanitizer.h"
#include "text_util.h"

#include <nlohmann/json.hpp>
#include <climits>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace ghg;
using nlohmann::json;

enum ExitCode { kExitOk = 0, kExitError = 1, kExitTripped = 2, kExitSkipped = 3 };

static void usage() {
  std::cerr <<
    "usage: ghguard [--config FILE] <command> [args]\n"
    "  sanitize [--label L] [FILE]\n"
    "  wrap --label L [FILE]\n"
    "  validate triage|review [FILE]\n"
    "  gate --actor NAME [FILE...]\n"
    "  dispatch --event FILE [--iterations N]\n"
    "  url --allow PATTERN [--allow PATTERN...] URL\n"
    "FILE defaults to standard input.\n";
}

static bool read_all(const std::string& path, std::string& out, std::string& err) {
  if (path.empty() || path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream f(path, std::ios::binary);
  if (!f) { err = "cannot open " + path; return false; }
  std::ostringstream ss; ss << f.rdbuf();
  out = ss.str();
  return true;
}

// --name VALUE pairs plus positionals; a missing value is a usage error.
struct Args {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string,std::string>> opts;

  std::string get(const std::string& k, const std::string& def = "") const {
    for (auto& [n,v] : opts) if (n == k) return v;
    return def;
  }
  std::vector<std::string> all(const std::string& k) const {
    std::vector<std::string> out;
    for (auto& [n,v] : opts) if (n == k) out.push_back(v);
    return out;
  }
};

static bool parse_args(int argc, char** argv, int from, Args& a, std::string& err) {
  for (int i = from; i < argc; ++i) {
    std::string s = argv[i];
    if (s.rfind("--", 0) == 0 && s.size() > 2) {
      if (i + 1 >= argc) { err = "missing value for " + s; return false; }
      a.opts.emplace_back(s.substr(2), argv[++i]);
    } else {
      a.positional.push_back(s);
    }
  }
  return true;
}

static int cmd_sanitize(const Args& a) {
  std::string text, err;
  if (!read_all(a.positional.empty() ? "" : a.positional[0], text, err)) { LOGE(err); return kExitError; }
  SanitizeResult r = sanitize(text, a.get("label", "unknown"));
  std::cout << toOutputText(toJson(r)) << "\n";
  return kExitOk;
}

static int cmd_wrap(const Args& a) {
  const std::string label = a.get("label");
  if (label.empty()) { usage(); return kExitError; }
  std::string text, err;
  if (!read_all(a.positional.empty() ? "" : a.positional[0], text, err)) { LOGE(err); return kExitError; }
  SanitizeResult r = sanitize(text, label);
  if (r.warningPrefix) std::cout << *r.warningPrefix << "\n";
  std::cout << wrapWithTrustBoundary(r.sanitizedText, label) << "\n";
  return kExitOk;
}

static int cmd_validate(const Args& a) {
  if (a.positional.empty()) { usage(); return kExitError; }
  const std::string kind = a.positional[0];
  std::string raw, err;
  if (!read_all(a.positional.size() > 1 ? a.positional[1] : "", raw, err)) { LOGE(err); return kExitError; }

  if (kind == "triage") {
    std::cout << toOutputText(toJson(validateTriageOutput(raw))) << "\n";
  } else if (kind == "review") {
    std::cout << toOutputText(toJson(validateReviewOutput(raw))) << "\n";
  } else {
    LOGE("validate: unknown kind '" + kind + "'");
    return kExitError;
  }
  return kExitOk;
}

static int cmd_gate(const Args& a) {
  const std::string actor = a.get("actor");
  if (isBot(actor)) {
    logEvent("", "gate_skip", {{"actor", actor}, {"reason", "bot-actor"}});
    return kExitSkipped;
  }
  std::vector<std::string> files = a.positional;
  if (files.empty()) files.push_back("");
  for (const auto& f : files) {
    std::string text, err;
    if (!read_all(f, text, err)) { LOGE(err); return kExitError; }
    if (hasStopCommand(text)) {
      logEvent("", "gate_skip", {{"actor", actor}, {"reason", "stop-command"}});
      return kExitSkipped;
    }
  }
  return kExitOk;
}

static int cmd_dispatch(const Args& a, const AppConfig& cfg) {
  std::string raw, err;
  if (!read_all(a.get("event"), raw, err)) { LOGE(err); return kExitError; }

  json event = json::parse(raw, nullptr, false);
  if (event.is_discarded()) {
    LOGW("dispatch: event payload is not JSON, assuming depth 0");
    event = json::object();
  }
  int iterations = 0;
  {
    auto n = parseIntPrefix(a.get("iterations", "0"));
    if (n && *n > 0) iterations = *n > INT_MAX ? INT_MAX : (int)*n;
  }

  CircuitBreakerContext ctx = makeContext(parseDispatchDepth(event), iterations);
  try {
    check(ctx, cfg.limits);
  } catch (const CircuitBreakerError& e) {
    logEvent("", "breaker_trip", {{"trip", tripName(e.trip())}, {"msg", e.what()}});
    return kExitTripped;
  }

  json extra = json::object();
  if (event.is_object() && event.contains("client_payload") && event["client_payload"].is_object())
    extra = event["client_payload"];
  std::cout << toOutputText(createDispatchPayload(ctx, extra)) << "\n";
  return kExitOk;
}

static int cmd_url(const Args& a, const AppConfig& cfg) {
  if (a.positional.empty()) { usage(); return kExitError; }
  std::vector<std::string> allow = a.all("allow");
  if (allow.empty()) allow = cfg.allowedDomains;
  auto url = sanitizeUrl(a.positional[0], allow);
  if (!url) {
    LOGW("url: rejected");
    return kExitError;
  }
  std::cout << *url << "\n";
  return kExitOk;
}

int main(int argc, char** argv) {
  AppConfig cfg;
  std::string err;
  if (!loadConfigFromEnv(cfg, err)) { LOGE("config: " + err); return kExitError; }

  int i = 1;
  if (i + 1 < argc && std::string(argv[i]) == "--config") {
    if (!loadConfigYaml(argv[i + 1], cfg, err)) { LOGE("config: " + err); return kExitError; }
    i += 2;
  }
  log_threshold() = cfg.run.logLevel;

  if (i >= argc) { usage(); return kExitError; }
  const std::string cmd = argv[i];

  Args args;
  if (!parse_args(argc, argv, i + 1, args, err)) { LOGE(err); usage(); return kExitError; }

  LOGD("command=" + cmd);
  if (cmd == "sanitize") return cmd_sanitize(args);
  if (cmd == "wrap")     return cmd_wrap(args);
  if (cmd == "validate") return cmd_validate(args);
  if (cmd == "gate")     return cmd_gate(args);
  if (cmd == "dispatch") return cmd_dispatch(args, cfg);
  if (cmd == "url")      return cmd_url(args, cfg);

  usage();
  return kExitError;
}
