#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;

  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  std::vector<std::string> args;

  // Cgroup (v2) directory the program is moved into before exec.
  std::string cgroup;
  // Run the program in new user and network namespaces, so that it has no
  // network interface apart from a down loopback.
  bool isolate_network = false;

  // Called in the parent with the PID of the program once it is started, and
  // again after it has exited but before it is reaped.
  std::function<void(int)> on_start;
  std::function<void(int)> on_exit;

  // Required values
  std::string root;
  std::string executable;
  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was killed because it hit the wall time limit.
  bool timed_out = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
