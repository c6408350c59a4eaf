// src/launch/PipelineSpec.cpp
#include "gstmulti/launch/PipelineSpec.h"

#include "gstmulti/launch/Errors.h"

#include <sstream>
#include <unordered_set>

namespace gstmulti {
namespace {

[[noreturn]] void malformed(const std::string& msg) {
  throw LaunchError(ErrorKind::MalformedSpec, msg);
}

} // namespace

std::string PipelineSpec::description() const {
  std::ostringstream ss;
  for (size_t i = 0; i < graph_tokens.size(); ++i) {
    if (i) ss << ' ';
    ss << graph_tokens[i];
  }
  return ss.str();
}

std::vector<PipelineSpec> parse_pipeline_specs(const std::vector<std::string>& tokens) {
  if (tokens.empty()) malformed("no pipeline given (expected '--pipeline --name NAME ...')");
  if (tokens.front() != kPipelineMarker) {
    malformed("expected '--pipeline' before '" + tokens.front() + "'");
  }

  std::vector<PipelineSpec> specs;
  size_t i = 0;
  while (i < tokens.size()) {
    // tokens[i] is always a pipeline marker here.
    const size_t segment = specs.size();
    ++i;
    if (i >= tokens.size() || tokens[i] != kNameMarker) {
      malformed("pipeline #" + std::to_string(segment) + ": missing '--name NAME'");
    }
    ++i;
    if (i >= tokens.size() || tokens[i].empty() || tokens[i] == kPipelineMarker ||
        tokens[i] == kNameMarker) {
      malformed("pipeline #" + std::to_string(segment) + ": missing pipeline name");
    }

    PipelineSpec spec;
    spec.name = tokens[i++];
    while (i < tokens.size() && tokens[i] != kPipelineMarker) {
      spec.graph_tokens.push_back(tokens[i++]);
    }
    if (spec.graph_tokens.empty()) {
      malformed("pipeline '" + spec.name + "': empty graph description");
    }
    specs.push_back(std::move(spec));
  }

  check_unique_names(specs);
  return specs;
}

void check_unique_names(const std::vector<PipelineSpec>& specs) {
  std::unordered_set<std::string> seen;
  for (const auto& s : specs) {
    if (!seen.insert(s.name).second) {
      malformed("pipeline name '" + s.name + "' is used more than once");
    }
  }
}

} // namespace gstmulti
