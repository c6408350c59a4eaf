#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gstmulti {

enum class CommandKind {
  SetProperty,
  GetProperty,
  GetLatency,
  SetLatency,
  PushLatencyEvent,
  SwitchPad,
  Help,
  Exit,
};

const char* command_name(CommandKind k);

// One parsed interpreter line. Fields not used by a command stay empty.
struct Command {
  CommandKind kind = CommandKind::Help;
  std::string pipeline;
  std::string element;
  std::string property;
  std::string value;
  std::string pad;
  std::optional<std::uint64_t> latency_ms;
};

// Parses "<verb> --flag value ..." (also "--flag=value").
// Returns std::nullopt for blank lines and '#' comments.
// Throws LaunchError(UnknownCommand) for an unknown verb, an unknown or
// repeated flag, a flag without value, a missing required flag, or a
// malformed --latency-ms.
std::optional<Command> parse_command(const std::string& line);

// One-line summary of the grammar.
std::string command_summary();

} // namespace gstmulti
