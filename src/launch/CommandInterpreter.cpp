// src/launch/CommandInterpreter.cpp
#include "gstmulti/launch/CommandInterpreter.h"

#include "gstmulti/gst/GstHelpers.h"
#include "gstmulti/launch/Errors.h"

#include <gst/gst.h>

#include <sstream>

namespace gstmulti {

CommandInterpreter::CommandInterpreter(PipelineRegistry& registry,
                                       LatencyCoordinator& latency,
                                       std::ostream& out)
  : registry_(registry), latency_(latency), out_(out) {}

std::string CommandInterpreter::execute(const Command& cmd) {
  std::ostringstream ss;
  ss << "ok: " << command_name(cmd.kind);

  switch (cmd.kind) {
    case CommandKind::SetProperty: {
      const std::string v = latency_.set_property(cmd.pipeline, cmd.element, cmd.property, cmd.value);
      ss << " pipeline=" << cmd.pipeline << " element=" << cmd.element
         << " property=" << cmd.property << " value=" << v;
      break;
    }
    case CommandKind::GetProperty: {
      const std::string v = latency_.get_property(cmd.pipeline, cmd.element, cmd.property);
      ss << " pipeline=" << cmd.pipeline << " element=" << cmd.element
         << " property=" << cmd.property << " value=" << v;
      break;
    }
    case CommandKind::GetLatency: {
      const LatencyRange r = latency_.get_latency(cmd.pipeline, cmd.element);
      ss << " pipeline=" << cmd.pipeline;
      if (!cmd.element.empty()) ss << " element=" << cmd.element;
      ss << " live=" << (r.live ? "true" : "false")
         << " min-ns=" << clock_time_to_string(r.min)
         << " max-ns=" << clock_time_to_string(r.max);
      if (cmd.element.empty()) ss << " configured-ns=" << clock_time_to_string(r.configured);
      break;
    }
    case CommandKind::SetLatency: {
      const GstClockTime ns = static_cast<GstClockTime>(cmd.latency_ms.value_or(0)) * GST_MSECOND;
      if (cmd.element.empty()) {
        latency_.set_latency(cmd.pipeline, ns);
        ss << " pipeline=" << cmd.pipeline;
      } else {
        latency_.set_element_latency(cmd.pipeline, cmd.element, ns);
        ss << " pipeline=" << cmd.pipeline << " element=" << cmd.element;
      }
      ss << " latency-ns=" << clock_time_to_string(ns);
      break;
    }
    case CommandKind::PushLatencyEvent:
      latency_.push_latency_event(cmd.pipeline);
      ss << " pipeline=" << cmd.pipeline;
      break;
    case CommandKind::SwitchPad:
      latency_.switch_pad(cmd.pipeline, cmd.element, cmd.pad);
      ss << " pipeline=" << cmd.pipeline << " element=" << cmd.element << " pad=" << cmd.pad;
      break;
    case CommandKind::Help:
      ss << " " << command_summary() << " (pipelines:";
      for (PipelineHandle* h : registry_.all()) ss << " " << h->name();
      ss << ")";
      break;
    case CommandKind::Exit:
      break;
  }
  return ss.str();
}

std::string CommandInterpreter::execute_line(const std::string& line, bool* exit_requested) {
  if (exit_requested) *exit_requested = false;
  try {
    const auto cmd = parse_command(line);
    if (!cmd) return {};
    ++commands_run_;
    std::string result = execute(*cmd);
    if (cmd->kind == CommandKind::Exit && exit_requested) *exit_requested = true;
    return result;
  } catch (const std::exception& e) {
    return format_command_error(e);
  }
}

CommandInterpreter::EndReason CommandInterpreter::run(LineSource& in) {
  std::string line;
  while (in.read_line(line)) {
    bool exit_requested = false;
    const std::string result = execute_line(line, &exit_requested);
    if (!result.empty()) out_ << result << std::endl;
    if (exit_requested) return EndReason::Exit;
  }
  return EndReason::EndOfInput;
}

} // namespace gstmulti
