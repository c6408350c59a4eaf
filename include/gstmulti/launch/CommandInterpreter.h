#pragma once

#include "gstmulti/launch/Command.h"
#include "gstmulti/launch/LatencyCoordinator.h"
#include "gstmulti/launch/LineSource.h"
#include "gstmulti/launch/PipelineRegistry.h"

#include <cstddef>
#include <ostream>
#include <string>

namespace gstmulti {

// Line-at-a-time operator console. Each command is parsed, dispatched and
// answered with exactly one "ok: ..." or "error: <Kind>: ..." line before the
// next line is read. Command errors never end the loop.
class CommandInterpreter {
public:
  enum class EndReason {
    Exit,
    EndOfInput,
  };

  CommandInterpreter(PipelineRegistry& registry, LatencyCoordinator& latency, std::ostream& out);

  // Runs one command; throws LaunchError on failure.
  std::string execute(const Command& cmd);

  // Parses and runs one line and returns its result line (empty for blank
  // and comment lines). Never throws LaunchError.
  std::string execute_line(const std::string& line, bool* exit_requested = nullptr);

  // Reads until `exit`, end of input or cancellation of the source.
  EndReason run(LineSource& in);

  size_t commands_run() const { return commands_run_; }

private:
  PipelineRegistry& registry_;
  LatencyCoordinator& latency_;
  std::ostream& out_;
  size_t commands_run_ = 0;
};

} // namespace gstmulti
