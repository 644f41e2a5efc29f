#ifndef ISOLATION_ISOLATED_SANDBOX_HPP
#define ISOLATION_ISOLATED_SANDBOX_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <kj/common.h>
#include "absl/types/optional.h"
#include "core/execution_result.hpp"
#include "isolation/isolated_environment.hpp"

namespace isolation {

struct SandboxConfig {
  Limits limits;
  int64_t timeout_millis = 30000;
  std::string interpreter = "python3";
  std::string temp_directory = "/tmp/runbox";
  // Names of environments start with this prefix.
  std::string name_prefix = "runbox";
};

// Owns one isolated environment and drives it through its lifecycle (see
// State). Execute calls must not overlap; Usage and UpdateLimits may run
// while an execution is in progress.
class IsolatedSandbox {
 public:
  // If backend is null, the best registered environment is used.
  explicit IsolatedSandbox(SandboxConfig config,
                           std::unique_ptr<Environment> backend = nullptr);
  // Tears the environment down if it is still alive.
  virtual ~IsolatedSandbox();
  KJ_DISALLOW_COPY(IsolatedSandbox);

  // Creates the environment. Only valid on an uninitialized sandbox; a failed
  // provisioning is final.
  bool Provision(std::string* error_msg);

  // Runs source in the environment. The timeout defaults to the one in the
  // configuration.
  core::ExecutionResult ExecuteInEnvironment(
      const std::string& source,
      absl::optional<int64_t> timeout_millis = absl::nullopt);

  // Stops and removes the environment. Returns false, and leaves the sandbox
  // in TEARDOWN_FAILED, if that could not be done.
  bool Teardown(std::string* error_msg);

  bool Usage(core::ResourceSnapshot* usage, std::string* error_msg);

  // Applies the given quotas to the live environment. Both are attempted even
  // if the first one fails.
  bool UpdateLimits(absl::optional<int64_t> memory_limit_mb,
                    absl::optional<double> cpu_fraction,
                    std::string* error_msg);

  State GetState() const;
  Limits GetLimits() const;
  const std::string& Id() const { return env_.id; }

 private:
  SandboxConfig config_;
  mutable std::mutex mutex_;
  IsolatedEnvironment env_;

  static std::atomic<uint64_t> next_id_;
};

// Provisions a sandbox, if it is not already, and tears it down when going
// out of scope, on every exit path.
class ScopedEnvironment {
 public:
  explicit ScopedEnvironment(IsolatedSandbox* sandbox);
  ~ScopedEnvironment();
  KJ_DISALLOW_COPY(ScopedEnvironment);

  bool Ready() const { return ready_; }
  const std::string& Error() const { return error_; }
  IsolatedSandbox* operator->() const { return sandbox_; }

 private:
  IsolatedSandbox* sandbox_;
  bool ready_ = false;
  std::string error_;
};

}  // namespace isolation

#endif
