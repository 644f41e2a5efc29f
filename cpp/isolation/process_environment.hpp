#ifndef ISOLATION_PROCESS_ENVIRONMENT_HPP
#define ISOLATION_PROCESS_ENVIRONMENT_HPP

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "isolation/cpu_throttle.hpp"
#include "isolation/environment.hpp"

namespace isolation {

// Fallback environment for hosts without a delegated cgroup: programs run in
// new user and network namespaces, with memory bounded by RLIMIT_AS. The CPU
// quota is approximated by a CpuThrottle that measures the main process of
// the program and stops its whole process group. Counters are read from /proc
// and only cover the main process of the program.
class ProcessEnvironment : public Environment {
 public:
  static Environment* Create() { return new ProcessEnvironment(); }
  static int Score() { return 1; }

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

  // Checks that the current user can create user and network namespaces.
  static bool NamespacesAvailable(std::string* error_msg);

  // Times the running (or else the last) program has been stopped to respect
  // the CPU quota.
  int64_t ThrottlePauses();

 private:
  // Reads utime + stime of pid, in microseconds.
  static bool ReadProcessCpu(pid_t pid, int64_t* micros,
                             std::string* error_msg);
  static bool ReadProcessMemory(pid_t pid, int64_t* bytes,
                                std::string* error_msg);

  std::mutex mutex_;
  int64_t memory_limit_mb_ = 0;
  double cpu_fraction_ = 0;
  pid_t running_ = 0;
  // Present while a program is running.
  std::unique_ptr<CpuThrottle> throttle_;
  int64_t last_pauses_ = 0;
  // CPU time used by programs that have already exited.
  int64_t finished_cpu_micros_ = 0;
  bool destroyed_ = false;
};

}  // namespace isolation

#endif
