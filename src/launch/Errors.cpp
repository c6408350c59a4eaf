// src/launch/Errors.cpp
#include "gstmulti/launch/Errors.h"

#include <utility>

namespace gstmulti {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedSpec:     return "MalformedSpec";
    case ErrorKind::ConstructionError: return "ConstructionError";
    case ErrorKind::NotFound:          return "NotFound";
    case ErrorKind::PropertyRejected:  return "PropertyRejected";
    case ErrorKind::QueryFailed:       return "QueryFailed";
    case ErrorKind::UnknownCommand:    return "UnknownCommand";
    case ErrorKind::EngineError:       return "EngineError";
    default:                           return "Unknown";
  }
}

LaunchError::LaunchError(ErrorKind kind, std::string msg)
  : std::runtime_error(std::move(msg)), kind_(kind) {}

LaunchError::LaunchError(ErrorKind kind, std::string msg, std::string pipeline)
  : std::runtime_error(std::move(msg)),
    kind_(kind),
    pipeline_(std::move(pipeline)) {}

std::string format_error_line(const LaunchError& e) {
  std::string line = "error: ";
  line += error_kind_name(e.kind());
  line += ": ";
  line += e.what();
  return line;
}

std::string format_command_error(const std::exception& e) {
  if (const auto* le = dynamic_cast<const LaunchError*>(&e)) return format_error_line(*le);
  return format_error_line(LaunchError(ErrorKind::QueryFailed, e.what()));
}

} // namespace gstmulti
