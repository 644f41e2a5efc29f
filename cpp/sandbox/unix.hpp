#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems: fork, resource limits and exec, with a
// watchdog that kills the whole process group at the wall time limit.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and never returns.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // Prepared before fork, as the child must not allocate.
  std::vector<char*> argv_;
  std::string cgroup_procs_;
};

}  // namespace sandbox
#endif
