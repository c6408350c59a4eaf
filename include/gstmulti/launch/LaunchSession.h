#pragma once

#include "gstmulti/launch/LatencyCoordinator.h"
#include "gstmulti/launch/LaunchOptions.h"
#include "gstmulti/launch/LineSource.h"
#include "gstmulti/launch/PipelineRegistry.h"
#include "gstmulti/launch/Supervisor.h"

#include <atomic>
#include <ostream>
#include <vector>

namespace gstmulti {

// Explicit context object for one run: owns the registry and wires it into
// the supervisor, the latency coordinator and the command interpreter.
// Destruction stops every pipeline before any of them is dropped.
class LaunchSession {
public:
  explicit LaunchSession(const LaunchOptions& opt = {});
  ~LaunchSession();

  LaunchSession(const LaunchSession&) = delete;
  LaunchSession& operator=(const LaunchSession&) = delete;

  // Builds and starts all pipelines; throws LaunchError (nothing left running).
  void launch(const std::vector<PipelineSpec>& specs);

  // Runs the interpreter over `commands` on a second thread while the calling
  // thread monitors the pipelines. Returns once the session ended and every
  // pipeline was stopped.
  Termination run(LineSource& commands,
                  std::ostream& out,
                  const std::atomic<bool>* interrupted = nullptr);

  // 0 for a normal end, 1 when a pipeline failed.
  static int exit_code(const Termination& t);

  PipelineRegistry& registry() { return registry_; }
  Supervisor& supervisor() { return supervisor_; }
  LatencyCoordinator& latency() { return latency_; }

private:
  LaunchOptions opt_;
  PipelineRegistry registry_;
  Supervisor supervisor_;
  LatencyCoordinator latency_;
};

} // namespace gstmulti
