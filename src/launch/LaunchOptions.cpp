// src/launch/LaunchOptions.cpp
#include "gstmulti/launch/LaunchOptions.h"

#include "gstmulti/launch/Errors.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace gstmulti {
namespace {

bool env_bool(const char* key, bool def_val) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def_val;
  if (!std::strcmp(v, "1") || !std::strcmp(v, "true") || !std::strcmp(v, "TRUE") ||
      !std::strcmp(v, "yes") || !std::strcmp(v, "YES") ||
      !std::strcmp(v, "on")  || !std::strcmp(v, "ON")) {
    return true;
  }
  if (!std::strcmp(v, "0") || !std::strcmp(v, "false") || !std::strcmp(v, "FALSE") ||
      !std::strcmp(v, "no") || !std::strcmp(v, "NO") ||
      !std::strcmp(v, "off") || !std::strcmp(v, "OFF")) {
    return false;
  }
  return def_val;
}

// Timeouts feed GstClockTime arithmetic and must be at least 1 ms.
void check_timeout(const char* key, long long v) {
  if (v < 1 || v > std::numeric_limits<int>::max()) {
    throw LaunchError(ErrorKind::MalformedSpec,
                      std::string(key) + " must be a positive number of milliseconds, got " +
                          std::to_string(v));
  }
}

int env_timeout_ms(const char* key, int def_val) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def_val;
  char* end = nullptr;
  errno = 0;
  const long long n = std::strtoll(v, &end, 10);
  if (errno != 0 || !end || *end != '\0') {
    throw LaunchError(ErrorKind::MalformedSpec,
                      std::string(key) + ": '" + v + "' is not an integer");
  }
  check_timeout(key, n);
  return static_cast<int>(n);
}

std::string env_str(const char* key, const std::string& def_val) {
  const char* v = std::getenv(key);
  if (!v) return def_val;
  return std::string(v);
}

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw LaunchError(ErrorKind::MalformedSpec,
                      std::string("config: bad value for '") + key + "': " + e.what());
  }
}

std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string tok;
  while (in >> tok) out.push_back(tok);
  return out;
}

nlohmann::json load_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw LaunchError(ErrorKind::MalformedSpec, "config: cannot open '" + path + "'");
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw LaunchError(ErrorKind::MalformedSpec,
                      "config: '" + path + "' is not valid JSON: " + e.what());
  }
}

} // namespace

LaunchOptions options_from_env() {
  LaunchOptions opt;
  opt.app_name = env_str("GSTMULTI_APP_NAME", opt.app_name);
  opt.verbose = env_bool("GSTMULTI_VERBOSE", opt.verbose);
  opt.dot_dir = env_str("GSTMULTI_DOT_DIR", opt.dot_dir);
  opt.state_timeout_ms = env_timeout_ms("GSTMULTI_STATE_TIMEOUT_MS", opt.state_timeout_ms);
  opt.stop_timeout_ms = env_timeout_ms("GSTMULTI_STOP_TIMEOUT_MS", opt.stop_timeout_ms);
  opt.shared_clock = env_bool("GSTMULTI_SHARED_CLOCK", opt.shared_clock);
  opt.restart_intersrc_on_eos = env_bool("GSTMULTI_RESTART_INTERSRC", opt.restart_intersrc_on_eos);
  return opt;
}

void apply_options_json(const nlohmann::json& j, LaunchOptions& opt) {
  if (!j.is_object()) {
    throw LaunchError(ErrorKind::MalformedSpec, "config: root must be a JSON object");
  }
  read_key(j, "app_name", opt.app_name);
  read_key(j, "verbose", opt.verbose);
  read_key(j, "dot_dir", opt.dot_dir);
  long long state_timeout = opt.state_timeout_ms;
  long long stop_timeout = opt.stop_timeout_ms;
  read_key(j, "state_timeout_ms", state_timeout);
  read_key(j, "stop_timeout_ms", stop_timeout);
  check_timeout("state_timeout_ms", state_timeout);
  check_timeout("stop_timeout_ms", stop_timeout);
  read_key(j, "shared_clock", opt.shared_clock);
  read_key(j, "restart_intersrc_on_eos", opt.restart_intersrc_on_eos);
  opt.state_timeout_ms = static_cast<int>(state_timeout);
  opt.stop_timeout_ms = static_cast<int>(stop_timeout);
}

std::vector<PipelineSpec> pipelines_from_json(const nlohmann::json& j) {
  std::vector<PipelineSpec> specs;
  if (!j.is_object() || !j.contains("pipelines")) return specs;

  const auto& arr = j.at("pipelines");
  if (!arr.is_array()) {
    throw LaunchError(ErrorKind::MalformedSpec, "config: 'pipelines' must be an array");
  }
  for (const auto& entry : arr) {
    if (!entry.is_object()) {
      throw LaunchError(ErrorKind::MalformedSpec, "config: pipeline entry must be an object");
    }
    PipelineSpec spec;
    read_key(entry, "name", spec.name);
    if (spec.name.empty()) {
      throw LaunchError(ErrorKind::MalformedSpec, "config: pipeline entry without a name");
    }
    if (entry.contains("spec") && entry.at("spec").is_string()) {
      spec.graph_tokens = split_ws(entry.at("spec").get<std::string>());
    } else {
      read_key(entry, "spec", spec.graph_tokens);
    }
    if (spec.graph_tokens.empty()) {
      throw LaunchError(ErrorKind::MalformedSpec,
                        "config: pipeline '" + spec.name + "': empty graph description");
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

LaunchArgs parse_launch_args(const std::vector<std::string>& args, const LaunchOptions& base) {
  LaunchArgs out;
  out.options = base;

  // Application flags end at the first pipeline marker.
  size_t i = 0;
  std::string config_path;
  std::string app_name;
  bool verbose = false;
  for (; i < args.size() && args[i] != kPipelineMarker; ++i) {
    const std::string& a = args[i];
    if (a == "--help" || a == "-h") {
      out.show_help = true;
    } else if (a == "--verbose" || a == "-v") {
      verbose = true;
    } else if ((a == "--config" || a == "--app-name") && i + 1 < args.size()) {
      (a == "--config" ? config_path : app_name) = args[++i];
    } else {
      throw LaunchError(ErrorKind::MalformedSpec, "unexpected argument '" + a + "'");
    }
  }
  if (out.show_help) return out;

  if (!config_path.empty()) {
    const nlohmann::json cfg = load_json_file(config_path);
    apply_options_json(cfg, out.options);
    out.pipelines = pipelines_from_json(cfg);
  }
  if (!app_name.empty()) out.options.app_name = app_name;
  if (verbose) out.options.verbose = true;

  if (i < args.size()) {
    std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    auto specs = parse_pipeline_specs(rest);
    out.pipelines.insert(out.pipelines.end(), specs.begin(), specs.end());
  }
  if (out.pipelines.empty()) {
    throw LaunchError(ErrorKind::MalformedSpec,
                      "no pipeline given (expected '--pipeline --name NAME ...')");
  }
  check_unique_names(out.pipelines);
  return out;
}

std::string usage(const std::string& program) {
  std::ostringstream ss;
  ss << "Usage: " << program
     << " [--app-name NAME] [--config FILE] [--verbose]"
        " --pipeline --name NAME <graph...> [--pipeline --name NAME <graph...> ...]\n"
     << "Commands (stdin): set-property, get-property, get-latency, set-latency,"
        " push-latency-event, switch-pad, help, exit\n";
  return ss.str();
}

} // namespace gstmulti
