#include "core/execution_result.hpp"

#include <utility>

#include "absl/strings/str_cat.h"

namespace core {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SYNTAX:
      return "Syntax";
    case ErrorKind::RUNTIME:
      return "Runtime";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::INTERNAL:
      return "Internal";
    case ErrorKind::TEARDOWN_FAILED:
      return "TeardownFailed";
  }
  return "Unknown";
}

ExecutionResult ExecutionResult::Success(std::string output) {
  ExecutionResult result;
  result.success = true;
  result.output = std::move(output);
  return result;
}

ExecutionResult ExecutionResult::Failure(ErrorKind kind, std::string error,
                                         absl::optional<std::string> output) {
  ExecutionResult result;
  result.success = false;
  result.error_kind = kind;
  if (error.empty()) error = absl::StrCat(ErrorKindName(kind), " error");
  result.error = std::move(error);
  result.output = std::move(output);
  return result;
}

std::string Describe(const ExecutionResult& result) {
  std::string out = absl::StrCat("success: ", result.success ? "true" : "false",
                                 "\nisolated: ",
                                 result.isolated ? "true" : "false", "\n");
  if (result.error_kind) {
    absl::StrAppend(&out, "error_kind: ", ErrorKindName(*result.error_kind),
                    "\n");
  }
  if (result.error) absl::StrAppend(&out, "error: ", *result.error, "\n");
  if (result.resource_usage) {
    absl::StrAppend(&out, "cpu_percent: ", result.resource_usage->cpu_percent,
                    "\nmemory_mb: ", result.resource_usage->memory_mb,
                    "\nmemory_percent: ",
                    result.resource_usage->memory_percent, "\n");
  }
  if (result.output) absl::StrAppend(&out, "output:\n", *result.output);
  return out;
}

}  // namespace core
