#pragma once

#include "gstmulti/launch/PipelineSpec.h"

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace gstmulti {

struct LaunchOptions {
  std::string app_name = "gst-launch-multi";
  bool verbose = false;
  std::string dot_dir;            // empty: no .dot dumps
  int state_timeout_ms = 5000;    // wait for a pipeline to reach PLAYING
  int stop_timeout_ms = 2000;     // per-pipeline teardown bound
  bool shared_clock = true;       // one clock + base time for all pipelines
  bool restart_intersrc_on_eos = true;
};

// Defaults overridden by GSTMULTI_* environment variables.
// Throws LaunchError(MalformedSpec) on a timeout that is not a positive integer.
LaunchOptions options_from_env();

// Overrides `opt` with the keys present in `j`. Throws LaunchError(MalformedSpec)
// on a key with the wrong type or a timeout below 1 ms.
void apply_options_json(const nlohmann::json& j, LaunchOptions& opt);

// Reads pipelines from a config "pipelines" array (may be absent).
std::vector<PipelineSpec> pipelines_from_json(const nlohmann::json& j);

struct LaunchArgs {
  LaunchOptions options;
  std::vector<PipelineSpec> pipelines;
  bool show_help = false;
};

// Parses the full argument list (without argv[0]):
//   [--app-name NAME] [--config FILE] [--verbose] [--help] --pipeline --name N ... [--pipeline ...]
// Config-file pipelines come first, then command-line ones.
LaunchArgs parse_launch_args(const std::vector<std::string>& args,
                             const LaunchOptions& base = options_from_env());

std::string usage(const std::string& program);

} // namespace gstmulti
