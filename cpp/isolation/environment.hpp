#ifndef ISOLATION_ENVIRONMENT_HPP
#define ISOLATION_ENVIRONMENT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace isolation {

// Quotas of an isolated environment.
struct Limits {
  // CPU quotas are expressed as a fraction of this period.
  static const constexpr int64_t kCpuPeriodMicros = 100000;

  int64_t memory_limit_mb = 128;
  double cpu_fraction = 0.5;

  int64_t CpuQuotaMicros() const {
    return static_cast<int64_t>(cpu_fraction * kCpuPeriodMicros);
  }
};

// Cumulative counters of a live environment.
struct Counters {
  int64_t cpu_usage_micros = 0;
  int64_t memory_usage_bytes = 0;
};

struct EnvironmentConfig {
  std::string name;
  Limits limits;
  // Name or path of the interpreter.
  std::string interpreter = "python3";
  // Where the workspace of the environment is created.
  std::string temp_directory = "/tmp/runbox";
};

// An isolated execution environment: programs run in it without network
// access and with bounded memory and CPU. Implementations need to register
// themselves by creating a global object of type
// Environment::Register<EnvironmentImpl>, and should define the static
// functions Create and Score with the same meaning they have for sandboxes.
// Unlike sandboxes, scores are computed again on every call to Create.
//
// ReadCounters, ApplyMemoryLimit and ApplyCpuLimit may be called while Run is
// executing on another thread. Run calls must not overlap.
class Environment {
 public:
  using create_t = std::function<Environment*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Environment> Create();

  // Creates the environment. On failure returns false and sets error_msg;
  // Destroy may then be called to release what was partially allocated.
  virtual bool Provision(const EnvironmentConfig& config,
                         std::string* error_msg) = 0;

  // Runs a program inside the environment, with the same contract as
  // Sandbox::Execute.
  virtual bool Run(sandbox::ExecutionOptions options,
                   sandbox::ExecutionInfo* info, std::string* error_msg) = 0;

  // Whether programs can still be run in the environment.
  virtual bool Usable() const = 0;

  virtual bool ReadCounters(Counters* counters, std::string* error_msg) = 0;
  virtual bool ApplyMemoryLimit(int64_t memory_limit_mb,
                                std::string* error_msg) = 0;
  virtual bool ApplyCpuLimit(double cpu_fraction, std::string* error_msg) = 0;

  // Kills whatever runs in the environment and removes it.
  virtual bool Destroy(std::string* error_msg) = 0;

  // Directory where programs are written and run.
  const std::string& Workspace() const;
  // Absolute path of the interpreter.
  const std::string& Interpreter() const { return interpreter_; }

  virtual ~Environment() = default;
  Environment() = default;
  Environment(const Environment&) = delete;
  Environment(Environment&&) = delete;
  Environment& operator=(const Environment&) = delete;
  Environment& operator=(Environment&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Environment::Register_(&T::Create, &T::Score); }
  };

 protected:
  // Acquires what every environment needs: the interpreter (looked up once
  // per process) and a private workspace.
  bool PrepareTemplate(const EnvironmentConfig& config, std::string* error_msg);

  // Removes the workspace. Returns false and sets error_msg on failure.
  bool RemoveWorkspace(std::string* error_msg);

  std::string interpreter_;
  std::unique_ptr<util::TempDir> workspace_;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Environments_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace isolation

#endif
