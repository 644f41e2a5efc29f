#ifndef ISOLATION_ISOLATED_ENVIRONMENT_HPP
#define ISOLATION_ISOLATED_ENVIRONMENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "absl/types/optional.h"
#include "isolation/environment.hpp"

namespace isolation {

// Lifecycle of an isolated environment:
//   UNINITIALIZED -> PROVISIONING -> READY | PROVISION_FAILED
//   READY -> EXECUTING -> READY | TERMINATING
//   READY | EXECUTING | TERMINATING -> TERMINATING -> DESTROYED
//                                                   | TEARDOWN_FAILED
// DESTROYED, PROVISION_FAILED and TEARDOWN_FAILED are terminal.
enum class State {
  UNINITIALIZED,
  PROVISIONING,
  READY,
  EXECUTING,
  TERMINATING,
  DESTROYED,
  PROVISION_FAILED,
  TEARDOWN_FAILED
};

const char* StateName(State state);

// Counters at the time of the previous usage sample, used to compute CPU
// percentages over the interval between two samples.
struct CpuBaseline {
  int64_t cpu_usage_micros = 0;
  int64_t system_micros = 0;
};

// Handle to an isolated environment.
struct IsolatedEnvironment {
  std::string id;
  State state = State::UNINITIALIZED;
  Limits limits;
  // Wall-clock deadline of each execution.
  int64_t timeout_millis = 0;
  std::unique_ptr<Environment> backend;
  absl::optional<CpuBaseline> cpu_baseline;
};

}  // namespace isolation

#endif
