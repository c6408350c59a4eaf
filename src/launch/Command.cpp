// src/launch/Command.cpp
#include "gstmulti/launch/Command.h"

#include "gstmulti/launch/Errors.h"

#include <cctype>
#include <limits>
#include <map>
#include <sstream>
#include <vector>

namespace gstmulti {
namespace {

struct Syntax {
  const char* verb;
  CommandKind kind;
  std::vector<std::string> required;
  std::vector<std::string> optional;
};

const std::vector<Syntax>& syntax_table() {
  static const std::vector<Syntax> table = {
    {"set-property", CommandKind::SetProperty, {"pipeline", "element", "property", "value"}, {}},
    {"get-property", CommandKind::GetProperty, {"pipeline", "element", "property"}, {}},
    {"get-latency", CommandKind::GetLatency, {"pipeline"}, {"element"}},
    {"set-latency", CommandKind::SetLatency, {"pipeline", "latency-ms"}, {"element"}},
    {"push-latency-event", CommandKind::PushLatencyEvent, {"pipeline"}, {}},
    {"switch-pad", CommandKind::SwitchPad, {"pipeline", "element", "pad"}, {}},
    {"help", CommandKind::Help, {}, {}},
    {"exit", CommandKind::Exit, {}, {}},
  };
  return table;
}

[[noreturn]] void bad_command(const std::string& msg) {
  throw LaunchError(ErrorKind::UnknownCommand, msg);
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  for (const auto& e : v) {
    if (e == s) return true;
  }
  return false;
}

std::uint64_t parse_latency_ms(const std::string& text) {
  if (text.empty()) bad_command("--latency-ms needs a value");
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      bad_command("--latency-ms must be a non-negative integer, got '" + text + "'");
    }
  }
  // Kept small enough to convert to nanoseconds without overflow.
  constexpr std::uint64_t kMaxMs = std::numeric_limits<std::uint64_t>::max() / 1000000ULL - 1;
  std::uint64_t v = 0;
  for (char c : text) {
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (v > (kMaxMs - digit) / 10) bad_command("--latency-ms value '" + text + "' is too large");
    v = v * 10 + digit;
  }
  return v;
}

} // namespace

const char* command_name(CommandKind k) {
  for (const auto& s : syntax_table()) {
    if (s.kind == k) return s.verb;
  }
  return "unknown";
}

std::optional<Command> parse_command(const std::string& line) {
  std::istringstream in(line);
  std::vector<std::string> tokens;
  std::string tok;
  while (in >> tok) tokens.push_back(tok);
  if (tokens.empty() || tokens.front()[0] == '#') return std::nullopt;

  const Syntax* syntax = nullptr;
  for (const auto& s : syntax_table()) {
    if (tokens.front() == s.verb) syntax = &s;
  }
  if (!syntax) bad_command("unknown command '" + tokens.front() + "' (try 'help')");

  std::map<std::string, std::string> opts;
  for (size_t i = 1; i < tokens.size(); ++i) {
    const std::string& t = tokens[i];
    if (t.size() < 3 || t.compare(0, 2, "--") != 0) {
      bad_command(std::string(syntax->verb) + ": unexpected token '" + t + "'");
    }
    std::string key = t.substr(2);
    std::string value;
    const size_t eq = key.find('=');
    if (eq != std::string::npos) {
      value = key.substr(eq + 1);
      key.resize(eq);
    } else if (i + 1 < tokens.size()) {
      value = tokens[++i];
    } else {
      bad_command(std::string(syntax->verb) + ": --" + key + " needs a value");
    }

    if (value.empty()) {
      bad_command(std::string(syntax->verb) + ": --" + key + " needs a value");
    }
    if (!contains(syntax->required, key) && !contains(syntax->optional, key)) {
      bad_command(std::string(syntax->verb) + ": unknown option --" + key);
    }
    if (!opts.emplace(key, value).second) {
      bad_command(std::string(syntax->verb) + ": --" + key + " given twice");
    }
  }
  for (const auto& r : syntax->required) {
    if (opts.find(r) == opts.end()) {
      bad_command(std::string(syntax->verb) + ": missing --" + r);
    }
  }

  Command cmd;
  cmd.kind = syntax->kind;
  for (const auto& kv : opts) {
    if (kv.first == "pipeline") cmd.pipeline = kv.second;
    else if (kv.first == "element") cmd.element = kv.second;
    else if (kv.first == "property") cmd.property = kv.second;
    else if (kv.first == "value") cmd.value = kv.second;
    else if (kv.first == "pad") cmd.pad = kv.second;
    else if (kv.first == "latency-ms") cmd.latency_ms = parse_latency_ms(kv.second);
  }
  return cmd;
}

std::string command_summary() {
  std::ostringstream ss;
  bool first = true;
  for (const auto& s : syntax_table()) {
    if (!first) ss << " | ";
    first = false;
    ss << s.verb;
    for (const auto& r : s.required) ss << " --" << r << " " << "<" << r << ">";
    for (const auto& o : s.optional) ss << " [--" << o << " <" << o << ">]";
  }
  return ss.str();
}

} // namespace gstmulti
