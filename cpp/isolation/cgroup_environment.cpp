#include "isolation/cgroup_environment.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include <kj/debug.h>
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace isolation {
namespace {
const constexpr int64_t kMiB = 1024 * 1024;
// How long Destroy waits for killed processes to leave the cgroup.
const constexpr auto kDrainTimeout = std::chrono::seconds(2);
const constexpr auto kDrainPoll = std::chrono::milliseconds(10);

// Control files cannot be replaced, only written in place. Returns errno, or 0
// on success.
int WriteInPlace(const std::string& path, const std::string& value) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1) return errno;
  ssize_t written = write(fd, value.data(), value.size());
  int err = written == static_cast<ssize_t>(value.size()) ? 0 : errno;
  close(fd);
  return err;
}
}  // namespace

int CgroupEnvironment::Score() {
  const std::string& root = Flags::cgroup_root;
  if (root.empty()) return -1;
  std::string controllers = util::File::JoinPath(root, "cgroup.controllers");
  if (!util::File::Exists(controllers)) return -1;
  if (access(root.c_str(), W_OK) != 0) return -1;
  return 3;
}

bool CgroupEnvironment::WriteControl(const std::string& name,
                                     const std::string& value,
                                     std::string* error_msg) {
  int err = WriteInPlace(util::File::JoinPath(path_, name), value);
  if (err != 0) {
    *error_msg = absl::StrCat(name, ": ", util::StrError(err));
    return false;
  }
  return true;
}

bool CgroupEnvironment::ReadControl(const std::string& name,
                                    std::string* value,
                                    std::string* error_msg) {
  try {
    *value = util::File::Read(util::File::JoinPath(path_, name));
  } catch (const std::system_error& exc) {
    *error_msg = absl::StrCat(name, ": ", exc.what());
    return false;
  }
  return true;
}

bool CgroupEnvironment::Provision(const EnvironmentConfig& config,
                                  std::string* error_msg) {
  std::string root = Flags::cgroup_root;
  // Controllers must be enabled on the parent before children get the
  // corresponding interface files.
  std::string subtree;
  try {
    subtree =
        util::File::Read(util::File::JoinPath(root, "cgroup.subtree_control"));
  } catch (const std::system_error& exc) {
    *error_msg = absl::StrCat("cgroup.subtree_control: ", exc.what());
    return false;
  }
  std::vector<std::string> enabled = util::split(util::trim(subtree), ' ');
  for (const char* controller : {"cpu", "memory"}) {
    if (std::find(enabled.begin(), enabled.end(), controller) !=
        enabled.end()) {
      continue;
    }
    int err =
        WriteInPlace(util::File::JoinPath(root, "cgroup.subtree_control"),
                     absl::StrCat("+", controller));
    if (err != 0) {
      *error_msg = absl::StrCat("enabling the ", controller,
                                " controller: ", util::StrError(err));
      return false;
    }
  }

  path_ = util::File::JoinPath(root, config.name);
  if (mkdir(path_.c_str(), 0755) == -1) {
    *error_msg = absl::StrCat("mkdir ", path_, ": ", util::StrError(errno));
    path_.clear();
    return false;
  }
  if (!WriteControl("memory.max",
                    std::to_string(config.limits.memory_limit_mb * kMiB),
                    error_msg)) {
    return false;
  }
  // Swap is not available everywhere; memory.max alone still bounds usage.
  std::string swap_error;
  if (!WriteControl("memory.swap.max", "0", &swap_error)) {
    KJ_LOG(INFO, "Cannot disable swap for the environment", swap_error);
  }
  if (!WriteControl("cpu.max",
                    absl::StrCat(config.limits.CpuQuotaMicros(), " ",
                                 Limits::kCpuPeriodMicros),
                    error_msg)) {
    return false;
  }
  return PrepareTemplate(config, error_msg);
}

bool CgroupEnvironment::Run(sandbox::ExecutionOptions options,
                            sandbox::ExecutionInfo* info,
                            std::string* error_msg) {
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "No sandbox available";
    return false;
  }
  options.cgroup = path_;
  options.isolate_network = true;
  return sb->Execute(options, info, error_msg);
}

bool CgroupEnvironment::Usable() const {
  return !path_.empty() &&
         util::File::Exists(util::File::JoinPath(path_, "cgroup.procs")) &&
         workspace_ != nullptr && util::File::Exists(workspace_->Path());
}

bool CgroupEnvironment::ReadCounters(Counters* counters,
                                     std::string* error_msg) {
  std::string stat;
  std::string current;
  if (!ReadControl("cpu.stat", &stat, error_msg)) return false;
  if (!ReadControl("memory.current", &current, error_msg)) return false;
  bool found = false;
  for (absl::string_view line : absl::StrSplit(stat, '\n')) {
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    if (fields.size() == 2 && fields[0] == "usage_usec") {
      found = absl::SimpleAtoi(fields[1], &counters->cpu_usage_micros);
    }
  }
  if (!found) {
    *error_msg = "cpu.stat: usage_usec not found";
    return false;
  }
  if (!absl::SimpleAtoi(util::trim(current), &counters->memory_usage_bytes)) {
    *error_msg = "memory.current: invalid value " + current;
    return false;
  }
  return true;
}

bool CgroupEnvironment::ApplyMemoryLimit(int64_t memory_limit_mb,
                                         std::string* error_msg) {
  return WriteControl("memory.max", std::to_string(memory_limit_mb * kMiB),
                      error_msg);
}

bool CgroupEnvironment::ApplyCpuLimit(double cpu_fraction,
                                      std::string* error_msg) {
  Limits limits;
  limits.cpu_fraction = cpu_fraction;
  return WriteControl(
      "cpu.max",
      absl::StrCat(limits.CpuQuotaMicros(), " ", Limits::kCpuPeriodMicros),
      error_msg);
}

bool CgroupEnvironment::KillAll(std::string* error_msg) {
  std::string kill_file = util::File::JoinPath(path_, "cgroup.kill");
  if (util::File::Exists(kill_file)) {
    if (!WriteControl("cgroup.kill", "1", error_msg)) return false;
  } else {
    std::string procs;
    if (!ReadControl("cgroup.procs", &procs, error_msg)) return false;
    for (const std::string& pid : util::split(procs, '\n')) {
      int value = 0;
      if (absl::SimpleAtoi(pid, &value)) kill(value, SIGKILL);
    }
  }
  auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
  while (true) {
    std::string procs;
    if (!ReadControl("cgroup.procs", &procs, error_msg)) return false;
    if (util::trim(procs).empty()) return true;
    if (std::chrono::steady_clock::now() > deadline) {
      *error_msg = "processes did not leave the cgroup: " + util::trim(procs);
      return false;
    }
    std::this_thread::sleep_for(kDrainPoll);
  }
}

bool CgroupEnvironment::Destroy(std::string* error_msg) {
  bool ok = true;
  if (!path_.empty() && util::File::Exists(path_)) {
    if (!KillAll(error_msg)) {
      ok = false;
    } else if (rmdir(path_.c_str()) == -1) {
      *error_msg = absl::StrCat("rmdir ", path_, ": ", util::StrError(errno));
      ok = false;
    }
  }
  std::string workspace_error;
  if (!RemoveWorkspace(&workspace_error)) {
    if (ok) *error_msg = workspace_error;
    ok = false;
  }
  return ok;
}

namespace {
Environment::Register<CgroupEnvironment> r;  // NOLINT
}  // namespace

}  // namespace isolation
