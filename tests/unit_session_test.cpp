#include "gstmulti/launch/Errors.h"
#include "gstmulti/launch/LaunchSession.h"

#include "test_utils.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

using gstmulti::ErrorKind;
using gstmulti::LaunchSession;
using gstmulti::PipelineSpec;
using gstmulti::PipelineState;
using gstmulti::TerminationCause;

static PipelineSpec make_spec(const std::string& name, const std::string& graph) {
  PipelineSpec s;
  s.name = name;
  std::istringstream in(graph);
  std::string tok;
  while (in >> tok) s.graph_tokens.push_back(tok);
  return s;
}

// An operator that never types anything; only cancel() ends the read.
class IdleLineSource : public gstmulti::LineSource {
public:
  bool read_line(std::string&) override {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return cancelled_; });
    return false;
  }
  void cancel() override {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

static const char* kEndless = "fakesrc ! queue name=q ! fakesink";

int main() {
  try {
    // Scripted console ending with exit.
    {
      LaunchSession session;
      session.launch({make_spec("a", kEndless), make_spec("b", kEndless)});
      std::istringstream script(
          "set-property --pipeline b --element q --property max-size-buffers --value 3\n"
          "exit\n");
      gstmulti::StreamLineSource src(script);
      std::ostringstream out;
      const auto t = session.run(src, out);
      require(t.cause == TerminationCause::Exit, "exit ends the session");
      require_contains(out.str(), "ok: set-property pipeline=b element=q property=max-size-buffers value=3\n",
                       "command answered");
      require_contains(out.str(), "ok: exit\n", "exit answered");
      for (auto* h : session.registry().all()) {
        require(h->state() == PipelineState::Stopped, h->name() + " stopped after run");
      }
      require(session.supervisor().stop_all_runs() == 1, "single teardown");
      require(LaunchSession::exit_code(t) == 0, "exit code 0");
    }

    // End of command input also ends the session normally.
    {
      LaunchSession session;
      session.launch({make_spec("a", kEndless)});
      std::istringstream script("help\n");
      gstmulti::StreamLineSource src(script);
      std::ostringstream out;
      const auto t = session.run(src, out);
      require(t.cause == TerminationCause::Exit, "end of input ends the session");
      require_contains(t.message, "end of command input", "reason recorded");
    }

    // A pipeline ending on its own stops every other pipeline and unblocks
    // the console.
    {
      LaunchSession session;
      session.launch({make_spec("endless", kEndless),
                      make_spec("finite", "fakesrc num-buffers=10 ! fakesink sync=false")});
      IdleLineSource idle;
      std::ostringstream out;
      const auto t = session.run(idle, out);
      require(t.cause == TerminationCause::EndOfStream, "EOS ends the session");
      require(t.pipeline == "finite", "EOS names the pipeline");
      require(session.registry().all()[0]->state() == PipelineState::Stopped, "endless stopped");
      require(LaunchSession::exit_code(t) == 0, "EOS is a normal end");
    }

    // Signal.
    {
      LaunchSession session;
      session.launch({make_spec("a", kEndless)});
      IdleLineSource idle;
      std::ostringstream out;
      std::atomic<bool> interrupted{false};
      std::thread signaller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        interrupted.store(true);
      });
      const auto t = session.run(idle, out, &interrupted);
      signaller.join();
      require(t.cause == TerminationCause::Interrupted, "interrupt ends the session");
      require(session.supervisor().stop_all_runs() == 1, "single teardown after interrupt");
    }

    // Startup failure leaves nothing running.
    {
      LaunchSession session;
      auto e = require_launch_error(
          [&] { session.launch({make_spec("a", kEndless), make_spec("b", "fakesrc ! nonexistent_el ! fakesink")}); },
          ErrorKind::ConstructionError, "broken second pipeline");
      require(e.pipeline() == "b", "failing pipeline named");
      require(session.registry().all()[0]->state() == PipelineState::Stopped, "first pipeline rolled back");
    }

    {
      gstmulti::Termination t;
      t.cause = TerminationCause::EngineError;
      require(LaunchSession::exit_code(t) == 1, "engine error exit code");
      t.cause = TerminationCause::Interrupted;
      require(LaunchSession::exit_code(t) == 0, "interrupt exit code");
    }

    std::cout << "[OK] unit_session_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
