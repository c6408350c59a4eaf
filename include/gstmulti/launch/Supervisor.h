#pragma once

#include "gstmulti/launch/LaunchOptions.h"
#include "gstmulti/launch/NotificationChannel.h"
#include "gstmulti/launch/PipelineRegistry.h"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gstmulti {

enum class TerminationCause {
  EndOfStream,
  EngineError,
  Exit,         // exit command or end of command input
  Interrupted,  // SIGINT / SIGTERM
};

const char* termination_cause_name(TerminationCause c);

struct Termination {
  TerminationCause cause = TerminationCause::Exit;
  std::string pipeline;  // which pipeline ended the session, if any
  std::string message;
};

// Drives registered pipelines to PLAYING, watches one bus per pipeline from a
// dedicated thread (fan-in through a single NotificationChannel) and stops the
// whole session as a unit.
class Supervisor {
public:
  explicit Supervisor(PipelineRegistry& registry, const LaunchOptions& opt = {});
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Registers and starts each spec in order. On the first failure every
  // pipeline started so far is stopped and the LaunchError naming the failing
  // pipeline is rethrown. A pipeline whose construction failed is never
  // registered.
  void launch(const std::vector<PipelineSpec>& specs);

  // Moves every registered, not yet running pipeline to PLAYING. All or
  // nothing: on failure the already started ones are stopped and the error
  // is rethrown.
  void start_all();

  // Blocks until a pipeline reports EOS or an error, a shutdown is requested,
  // or *interrupted becomes true. Latency messages are handled in between.
  // EOS and errors stop every pipeline before monitor() returns.
  Termination monitor(const std::atomic<bool>* interrupted = nullptr);

  // Stops every pipeline. Only the first call does anything; failures are
  // recorded in stop_failures() and never thrown.
  void stop_all();

  // Wakes monitor() with TerminationCause::Exit. Safe from any thread.
  void request_shutdown(const std::string& reason);

  int stop_all_runs() const;
  std::vector<std::string> stop_failures() const;

private:
  void start_one(PipelineHandle& h);
  void start_watcher(PipelineHandle& h);
  void stop_watchers();
  void watch_bus(PipelineHandle* h);
  void recalculate_latency(const std::string& pipeline_name);

  PipelineRegistry& registry_;
  LaunchOptions opt_;
  NotificationChannel channel_;

  std::mutex watchers_mu_;
  std::vector<std::thread> watchers_;
  std::atomic<bool> watchers_stop_{false};

  mutable std::mutex stop_mu_;
  bool stopped_all_ = false;
  int stop_all_runs_ = 0;
  std::vector<std::string> stop_failures_;
};

} // namespace gstmulti
