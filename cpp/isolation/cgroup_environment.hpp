#ifndef ISOLATION_CGROUP_ENVIRONMENT_HPP
#define ISOLATION_CGROUP_ENVIRONMENT_HPP

#include <string>

#include "isolation/environment.hpp"

namespace isolation {

// Environment backed by a cgroup (v2) created below Flags::cgroup_root.
// Memory is bounded by memory.max (without swap), CPU by cpu.max, and
// programs run in their own network namespace. Usable only when the cgroup
// root has been delegated to the current user.
class CgroupEnvironment : public Environment {
 public:
  static Environment* Create() { return new CgroupEnvironment(); }
  static int Score();

  bool Provision(const EnvironmentConfig& config,
                 std::string* error_msg) override;
  bool Run(sandbox::ExecutionOptions options, sandbox::ExecutionInfo* info,
           std::string* error_msg) override;
  bool Usable() const override;
  bool ReadCounters(Counters* counters, std::string* error_msg) override;
  bool ApplyMemoryLimit(int64_t memory_limit_mb,
                        std::string* error_msg) override;
  bool ApplyCpuLimit(double cpu_fraction, std::string* error_msg) override;
  bool Destroy(std::string* error_msg) override;

  const std::string& Path() const { return path_; }

 private:
  bool WriteControl(const std::string& name, const std::string& value,
                    std::string* error_msg);
  bool ReadControl(const std::string& name, std::string* value,
                   std::string* error_msg);
  // Kills every process in the cgroup and waits for it to be empty.
  bool KillAll(std::string* error_msg);

  std::string path_;
};

}  // namespace isolation

#endif
