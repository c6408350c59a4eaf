#include "gstmulti/launch/Errors.h"
#include "gstmulti/launch/LaunchOptions.h"
#include "gstmulti/launch/LaunchSession.h"
#include "gstmulti/launch/LineSource.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_interrupted{false};
static void on_signal(int) { g_interrupted.store(true); }

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  std::cerr.setf(std::ios::unitbuf);

  const std::string program = argc > 0 ? argv[0] : "gst-launch-multi";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  gstmulti::LaunchArgs launch_args;
  try {
    launch_args = gstmulti::parse_launch_args(args);
  } catch (const gstmulti::LaunchError& e) {
    std::cerr << gstmulti::format_error_line(e) << "\n" << gstmulti::usage(program);
    return 2;
  }
  if (launch_args.show_help) {
    std::cout << gstmulti::usage(program);
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    gstmulti::LaunchSession session(launch_args.options);
    session.launch(launch_args.pipelines);

    gstmulti::FdLineSource console(STDIN_FILENO);
    const gstmulti::Termination t = session.run(console, std::cout, &g_interrupted);
    return gstmulti::LaunchSession::exit_code(t);
  } catch (const gstmulti::LaunchError& e) {
    std::cerr << gstmulti::format_error_line(e) << "\n";
    return e.kind() == gstmulti::ErrorKind::MalformedSpec ? 2 : 1;
  }
}
