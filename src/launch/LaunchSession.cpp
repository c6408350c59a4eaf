// src/launch/LaunchSession.cpp
#include "gstmulti/launch/LaunchSession.h"

#include "gstmulti/launch/CommandInterpreter.h"

#include <glib.h>

#include <iostream>
#include <thread>

namespace gstmulti {

LaunchSession::LaunchSession(const LaunchOptions& opt)
  : opt_(opt),
    registry_(opt),
    supervisor_(registry_, opt),
    latency_(registry_) {
  g_set_prgname(opt_.app_name.c_str());
}

LaunchSession::~LaunchSession() {
  supervisor_.stop_all();
}

void LaunchSession::launch(const std::vector<PipelineSpec>& specs) {
  supervisor_.launch(specs);
  if (opt_.verbose) {
    std::cerr << "[session] " << opt_.app_name << ": " << registry_.size()
              << " pipeline(s) running\n";
  }
}

Termination LaunchSession::run(LineSource& commands,
                               std::ostream& out,
                               const std::atomic<bool>* interrupted) {
  CommandInterpreter interpreter(registry_, latency_, out);

  std::thread console([&]() {
    const auto why = interpreter.run(commands);
    supervisor_.request_shutdown(why == CommandInterpreter::EndReason::Exit
                                     ? "exit command"
                                     : "end of command input");
  });

  const Termination t = supervisor_.monitor(interrupted);
  supervisor_.stop_all();
  commands.cancel();
  console.join();

  std::cerr << "[session] " << opt_.app_name << " ended: " << termination_cause_name(t.cause);
  if (!t.pipeline.empty()) std::cerr << " (pipeline " << t.pipeline << ")";
  if (!t.message.empty()) std::cerr << ": " << t.message;
  std::cerr << "\n";
  return t;
}

int LaunchSession::exit_code(const Termination& t) {
  return t.cause == TerminationCause::EngineError ? 1 : 0;
}

} // namespace gstmulti
