#include "isolation/process_environment.hpp"

#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>

#include <kj/debug.h>
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace isolation {

bool ProcessEnvironment::NamespacesAvailable(std::string* error_msg) {
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = "fork: " + util::StrError(errno);
    return false;
  }
  if (pid == 0) {
    _exit(unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0 ? 0 : 1);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      *error_msg = "waitpid: " + util::StrError(errno);
      return false;
    }
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    *error_msg = "unprivileged network namespaces are not available";
    return false;
  }
  return true;
}

bool ProcessEnvironment::Provision(const EnvironmentConfig& config,
                                   std::string* error_msg) {
  if (!NamespacesAvailable(error_msg)) return false;
  if (!PrepareTemplate(config, error_msg)) return false;
  std::lock_guard<std::mutex> lck(mutex_);
  memory_limit_mb_ = config.limits.memory_limit_mb;
  cpu_fraction_ = config.limits.cpu_fraction;
  KJ_LOG(WARNING,
         "No cgroup available: the CPU quota is approximated by stopping the "
         "program when it exceeds it",
         config.name, cpu_fraction_);
  return true;
}

bool ProcessEnvironment::Run(sandbox::ExecutionOptions options,
                             sandbox::ExecutionInfo* info,
                             std::string* error_msg) {
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "No sandbox available";
    return false;
  }
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (destroyed_) {
      *error_msg = "Environment destroyed";
      return false;
    }
    options.memory_limit_kb = memory_limit_mb_ * 1024;
  }
  options.isolate_network = true;
  options.on_start = [this](int pid) {
    std::lock_guard<std::mutex> lck(mutex_);
    running_ = pid;
    if (destroyed_) {
      kill(-pid, SIGKILL);
      return;
    }
    throttle_ = std::make_unique<CpuThrottle>(
        pid, cpu_fraction_, [pid](int64_t* micros) {
          std::string error;
          return ReadProcessCpu(pid, micros, &error);
        });
  };
  // The program is not reaped yet, so its final times are still readable.
  options.on_exit = [this](int pid) {
    std::lock_guard<std::mutex> lck(mutex_);
    if (throttle_) {
      throttle_->Stop();
      last_pauses_ = throttle_->Pauses();
      throttle_.reset();
    }
    int64_t micros = 0;
    std::string error;
    if (ReadProcessCpu(pid, &micros, &error)) {
      finished_cpu_micros_ += micros;
    } else {
      KJ_LOG(WARNING, "Cannot read final CPU time", pid, error);
    }
    running_ = 0;
  };
  return sb->Execute(options, info, error_msg);
}

bool ProcessEnvironment::Usable() const {
  return workspace_ != nullptr && util::File::Exists(workspace_->Path());
}

bool ProcessEnvironment::ReadProcessCpu(pid_t pid, int64_t* micros,
                                        std::string* error_msg) {
  std::string stat;
  try {
    stat = util::File::Read(absl::StrCat("/proc/", pid, "/stat"));
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  // The command name may contain spaces and parentheses.
  size_t end = stat.rfind(')');
  if (end == std::string::npos) {
    *error_msg = "malformed /proc/<pid>/stat";
    return false;
  }
  std::vector<absl::string_view> fields =
      absl::StrSplit(absl::string_view(stat).substr(end + 1), ' ',
                     absl::SkipEmpty());
  // Fields after the command name start from the third one, "state".
  const size_t kUtime = 14 - 3;
  const size_t kStime = 15 - 3;
  int64_t utime = 0;
  int64_t stime = 0;
  if (fields.size() <= kStime || !absl::SimpleAtoi(fields[kUtime], &utime) ||
      !absl::SimpleAtoi(fields[kStime], &stime)) {
    *error_msg = "malformed /proc/<pid>/stat";
    return false;
  }
  long ticks = sysconf(_SC_CLK_TCK);  // NOLINT
  *micros = (utime + stime) * 1000000 / ticks;
  return true;
}

bool ProcessEnvironment::ReadProcessMemory(pid_t pid, int64_t* bytes,
                                           std::string* error_msg) {
  std::string statm;
  try {
    statm = util::File::Read(absl::StrCat("/proc/", pid, "/statm"));
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  std::vector<std::string> fields = util::split(util::trim(statm), ' ');
  int64_t resident = 0;
  if (fields.size() < 2 || !absl::SimpleAtoi(fields[1], &resident)) {
    *error_msg = "malformed /proc/<pid>/statm";
    return false;
  }
  *bytes = resident * sysconf(_SC_PAGESIZE);
  return true;
}

bool ProcessEnvironment::ReadCounters(Counters* counters,
                                      std::string* error_msg) {
  std::lock_guard<std::mutex> lck(mutex_);
  counters->cpu_usage_micros = finished_cpu_micros_;
  counters->memory_usage_bytes = 0;
  if (running_ == 0) return true;
  int64_t micros = 0;
  if (!ReadProcessCpu(running_, &micros, error_msg)) return false;
  if (!ReadProcessMemory(running_, &counters->memory_usage_bytes, error_msg)) {
    return false;
  }
  counters->cpu_usage_micros += micros;
  return true;
}

bool ProcessEnvironment::ApplyMemoryLimit(int64_t memory_limit_mb,
                                          std::string* error_msg) {
  std::lock_guard<std::mutex> lck(mutex_);
  if (running_ != 0) {
    struct rlimit rlim;
    rlim.rlim_cur = rlim.rlim_max = memory_limit_mb * 1024 * 1024;
    if (prlimit(running_, RLIMIT_AS, &rlim, nullptr) == -1) {
      *error_msg = "prlimit: " + util::StrError(errno);
      return false;
    }
  }
  memory_limit_mb_ = memory_limit_mb;
  return true;
}

bool ProcessEnvironment::ApplyCpuLimit(double cpu_fraction,
                                       std::string* /*error_msg*/) {
  std::lock_guard<std::mutex> lck(mutex_);
  cpu_fraction_ = cpu_fraction;
  if (throttle_) throttle_->SetFraction(cpu_fraction);
  return true;
}

int64_t ProcessEnvironment::ThrottlePauses() {
  std::lock_guard<std::mutex> lck(mutex_);
  return throttle_ ? throttle_->Pauses() : last_pauses_;
}

bool ProcessEnvironment::Destroy(std::string* error_msg) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    destroyed_ = true;
    // The program leads its own process group.
    if (running_ != 0 && kill(-running_, SIGKILL) == -1 && errno != ESRCH) {
      *error_msg = "kill: " + util::StrError(errno);
      return false;
    }
  }
  return RemoveWorkspace(error_msg);
}

namespace {
Environment::Register<ProcessEnvironment> r;  // NOLINT
}  // namespace

}  // namespace isolation
