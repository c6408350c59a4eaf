#pragma once

#include <stdexcept>
#include <string>

namespace gstmulti {

enum class ErrorKind {
  MalformedSpec,
  ConstructionError,
  NotFound,
  PropertyRejected,
  QueryFailed,
  UnknownCommand,
  EngineError,
};

const char* error_kind_name(ErrorKind kind);

// Exception that carries an error kind and, when known, the pipeline it refers to.
class LaunchError : public std::runtime_error {
public:
  LaunchError(ErrorKind kind, std::string msg);
  LaunchError(ErrorKind kind, std::string msg, std::string pipeline);

  ErrorKind kind() const { return kind_; }
  const std::string& pipeline() const { return pipeline_; }

private:
  ErrorKind kind_;
  std::string pipeline_;
};

// "error: <Kind>: <message>"
std::string format_error_line(const LaunchError& e);

// Error line for a failed interpreter command. Exceptions that are not a
// LaunchError are reported as QueryFailed; the loop keeps going either way.
std::string format_command_error(const std::exception& e);

} // namespace gstmulti
