#ifndef CORE_EXECUTION_RESULT_HPP
#define CORE_EXECUTION_RESULT_HPP

#include <string>

#include "absl/types/optional.h"

namespace core {

enum class ErrorKind {
  SYNTAX,          // the source failed static validation
  RUNTIME,         // the program exited with an error or was killed
  TIMEOUT,         // the wall-clock deadline was exceeded
  INTERNAL,        // provisioning, spawning or monitoring failed
  TEARDOWN_FAILED  // an isolated environment could not be removed
};

const char* ErrorKindName(ErrorKind kind);

// Point-in-time resource usage of an isolated environment.
struct ResourceSnapshot {
  double cpu_percent = 0;
  double memory_mb = 0;
  double memory_percent = 0;
};

struct ExecutionRequest {
  std::string source;
  // Overrides the default wall-clock deadline.
  absl::optional<double> timeout_seconds;
  // Overrides the default routing (isolated or direct execution).
  absl::optional<bool> isolate;
};

// Outcome of an execution. A failed result always has an error message and
// an error kind, a successful one never has an error kind.
struct ExecutionResult {
  bool success = false;
  absl::optional<std::string> output;
  absl::optional<std::string> error;
  absl::optional<ErrorKind> error_kind;
  bool isolated = false;
  absl::optional<ResourceSnapshot> resource_usage;

  static ExecutionResult Success(std::string output);
  static ExecutionResult Failure(
      ErrorKind kind, std::string error,
      absl::optional<std::string> output = absl::nullopt);
};

// Human-readable rendering, for logs.
std::string Describe(const ExecutionResult& result);

}  // namespace core

#endif
