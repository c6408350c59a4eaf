#pragma once

#include <string>
#include <vector>

namespace gstmulti {

constexpr const char* kPipelineMarker = "--pipeline";
constexpr const char* kNameMarker = "--name";

struct PipelineSpec {
  std::string name;
  std::vector<std::string> graph_tokens;

  // Graph description handed to the GStreamer parser.
  std::string description() const;
};

// Splits "--pipeline --name A <tokens...> --pipeline --name B <tokens...>"
// into one PipelineSpec per segment, in input order.
// Throws LaunchError(MalformedSpec) and produces nothing on any violation:
// first token not a marker, missing or empty name, repeated name, or a
// segment without graph tokens.
std::vector<PipelineSpec> parse_pipeline_specs(const std::vector<std::string>& tokens);

// Same rule set, for specs gathered from several sources (config + CLI).
void check_unique_names(const std::vector<PipelineSpec>& specs);

} // namespace gstmulti
