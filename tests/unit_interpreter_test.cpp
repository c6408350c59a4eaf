#include "gstmulti/gst/GstInit.h"
#include "gstmulti/launch/Errors.h"
#include "gstmulti/launch/CommandInterpreter.h"
#include "gstmulti/launch/LatencyCoordinator.h"
#include "gstmulti/launch/PipelineRegistry.h"
#include "gstmulti/launch/Supervisor.h"

#include "test_utils.h"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using gstmulti::CommandInterpreter;
using gstmulti::PipelineSpec;

static PipelineSpec make_spec(const std::string& name, const std::string& graph) {
  PipelineSpec s;
  s.name = name;
  std::istringstream in(graph);
  std::string tok;
  while (in >> tok) s.graph_tokens.push_back(tok);
  return s;
}

static std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string l;
  while (std::getline(in, l)) out.push_back(l);
  return out;
}

int main() {
  try {
    gstmulti::gst_init_once();

    gstmulti::LaunchOptions opt;
    gstmulti::PipelineRegistry reg(opt);
    gstmulti::Supervisor sup(reg, opt);
    gstmulti::LatencyCoordinator lc(reg);
    sup.launch({make_spec("main", "fakesrc ! queue name=q ! fakesink name=sink")});

    std::ostringstream out;
    CommandInterpreter ci(reg, lc, out);

    {
      bool exit_requested = true;
      require(ci.execute_line("", &exit_requested).empty(), "blank line has no result");
      require(!exit_requested, "blank line does not exit");
      require(ci.execute_line("# tune the queue").empty(), "comment has no result");
      require(ci.commands_run() == 0, "blank and comment lines are not commands");
    }

    require(ci.execute_line("set-property --pipeline main --element q --property max-size-buffers --value 7") ==
                "ok: set-property pipeline=main element=q property=max-size-buffers value=7",
            "set-property result line");
    require(ci.execute_line("get-property --pipeline main --element q --property max-size-buffers") ==
                "ok: get-property pipeline=main element=q property=max-size-buffers value=7",
            "get-property result line");
    require(ci.execute_line("set-latency --pipeline main --latency-ms 250") ==
                "ok: set-latency pipeline=main latency-ns=250000000",
            "set-latency result line");
    require_contains(ci.execute_line("help"), "ok: help ", "help result");
    require_contains(ci.execute_line("help"), "(pipelines: main)", "help lists pipelines");

    require(ci.execute_line("frobnicate") ==
                "error: UnknownCommand: unknown command 'frobnicate' (try 'help')",
            "unknown verb result line");
    require_contains(ci.execute_line("get-latency --pipeline nowhere"),
                     "error: NotFound: ", "unknown pipeline result");
    require_contains(ci.execute_line("set-property --pipeline main --element q --property colour --value red"),
                     "error: NotFound: ", "unknown property result");
    require_contains(ci.execute_line("set-property --pipeline main --element q --property max-size-buffers --value many"),
                     "error: PropertyRejected: ", "bad value result");

    // Failures other than LaunchError stay recoverable command errors.
    require(gstmulti::format_command_error(std::runtime_error("bad cast")) ==
                "error: QueryFailed: bad cast",
            "foreign exception mapped to a recoverable kind");
    require(gstmulti::format_command_error(
                gstmulti::LaunchError(gstmulti::ErrorKind::NotFound, "no such pipeline")) ==
                "error: NotFound: no such pipeline",
            "LaunchError keeps its kind");

    {
      bool exit_requested = false;
      require(ci.execute_line("exit", &exit_requested) == "ok: exit", "exit result line");
      require(exit_requested, "exit requested");
    }

    // run(): one result line per command, errors do not stop the loop,
    // nothing after exit is read.
    {
      std::ostringstream run_out;
      CommandInterpreter runner(reg, lc, run_out);
      std::istringstream script(
          "# script\n"
          "\n"
          "get-property --pipeline main --element q --property max-size-buffers\n"
          "bogus --x 1\n"
          "set-property --pipeline main --element q --property max-size-buffers --value 9\n"
          "exit\n"
          "set-property --pipeline main --element q --property max-size-buffers --value 11\n");
      gstmulti::StreamLineSource src(script);
      require(runner.run(src) == CommandInterpreter::EndReason::Exit, "run ends on exit");
      const auto lines = lines_of(run_out.str());
      require(lines.size() == 4, "one line per command");
      require(lines[0] == "ok: get-property pipeline=main element=q property=max-size-buffers value=7",
              "first result");
      require_contains(lines[1], "error: UnknownCommand: ", "error result");
      require_contains(lines[2], "value=9", "loop continued after the error");
      require(lines[3] == "ok: exit", "exit acknowledged");
      require(lc.get_property("main", "q", "max-size-buffers") == "9", "line after exit never ran");
    }

    {
      std::ostringstream run_out;
      CommandInterpreter runner(reg, lc, run_out);
      std::istringstream script("help\n");
      gstmulti::StreamLineSource src(script);
      require(runner.run(src) == CommandInterpreter::EndReason::EndOfInput, "end of input");
      require(runner.commands_run() == 1, "one command ran");
    }

    sup.stop_all();
    std::cout << "[OK] unit_interpreter_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
