#ifndef EXECUTOR_ORCHESTRATOR_HPP
#define EXECUTOR_ORCHESTRATOR_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <kj/common.h>
#include "absl/types/optional.h"
#include "core/execution_result.hpp"
#include "executor/direct_executor.hpp"
#include "isolation/isolated_sandbox.hpp"

namespace executor {

struct OrchestratorConfig {
  bool isolate = true;
  int64_t default_timeout_millis = 30000;
  int64_t memory_limit_mb = 128;
  double cpu_fraction = 0.5;
  std::string interpreter = "python3";
  std::string temp_directory = "/tmp/runbox";
  // Reuse one isolated environment across executions instead of creating a
  // new one each time.
  bool keep_environment = false;
  int32_t provision_attempts = 1;

  static OrchestratorConfig FromFlags();
};

// Outcome of ExecutionOrchestrator::UpdateLimits, with the quotas in effect
// afterwards.
struct LimitsUpdate {
  bool success = false;
  std::string error;
  int64_t memory_limit_mb = 0;
  double cpu_fraction = 0;
};

// Entry point for running untrusted programs: validates them, routes them to
// direct or isolated execution, and turns every failure into an
// ExecutionResult. No method throws. Direct executions and executions in fresh
// environments run concurrently; executions in a kept environment are
// serialized.
class ExecutionOrchestrator {
 public:
  using SandboxFactory =
      std::function<std::unique_ptr<isolation::IsolatedSandbox>(
          const isolation::SandboxConfig&)>;

  // Null arguments select the default implementations.
  explicit ExecutionOrchestrator(
      OrchestratorConfig config,
      std::unique_ptr<DirectExecutor> direct = nullptr,
      SandboxFactory sandbox_factory = nullptr);
  ~ExecutionOrchestrator();
  KJ_DISALLOW_COPY(ExecutionOrchestrator);

  core::ExecutionResult Execute(const core::ExecutionRequest& request);

  // Like Execute, but always isolated, with resource_usage holding the peak
  // usage observed while the program ran.
  core::ExecutionResult ExecuteWithMonitoring(
      const core::ExecutionRequest& request);

  // Records new quotas for future environments and applies them to every live
  // one.
  LimitsUpdate UpdateLimits(absl::optional<int64_t> memory_limit_mb,
                            absl::optional<double> cpu_fraction);

  // Tears down the kept environment. Fails with TEARDOWN_FAILED if it could
  // not be removed.
  core::ExecutionResult Close();

 private:
  core::ExecutionResult Dispatch(const core::ExecutionRequest& request,
                                 bool monitor);
  core::ExecutionResult RunIsolated(const std::string& source,
                                    int64_t timeout_millis, bool monitor);
  core::ExecutionResult RunIn(isolation::IsolatedSandbox* sandbox,
                              const std::string& source,
                              int64_t timeout_millis, bool monitor);
  // Returns a sandbox for a new environment, provisioned if possible. Retries
  // with exponential backoff.
  std::unique_ptr<isolation::IsolatedSandbox> AcquireSandbox(
      std::string* error_msg);
  // Close, with exec_mutex_ already held.
  core::ExecutionResult CloseLocked();
  void AddLive(isolation::IsolatedSandbox* sandbox);
  void RemoveLive(isolation::IsolatedSandbox* sandbox);

  OrchestratorConfig config_;
  std::unique_ptr<DirectExecutor> direct_;
  SandboxFactory sandbox_factory_;

  // Serializes the use of kept_.
  std::mutex exec_mutex_;
  // Guards the limits in config_, kept_ and live_.
  std::mutex sandbox_mutex_;
  std::unique_ptr<isolation::IsolatedSandbox> kept_;
  // Provisioned sandboxes that have not been torn down yet.
  std::set<isolation::IsolatedSandbox*> live_;
};

}  // namespace executor

#endif
