#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <kj/debug.h>
#include "util/misc.hpp"
#include "util/watchdog.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Writes "<id> <id> 1" into buf, without allocating.
void FormatIdMap(unsigned id, char* buf, size_t buf_size) {
  char digits[16] = {};
  size_t n = 0;
  do {
    digits[n++] = static_cast<char>('0' + id % 10);
    id /= 10;
  } while (id != 0 && n < sizeof(digits));
  size_t pos = 0;
  for (int copy = 0; copy < 2; copy++) {
    for (size_t i = n; i > 0 && pos + 1 < buf_size; i--) {
      buf[pos++] = digits[i - 1];
    }
    if (pos + 1 < buf_size) buf[pos++] = ' ';
  }
  if (pos + 1 < buf_size) buf[pos++] = '1';
  buf[pos] = '\0';
}

// Returns errno, or 0 on success.
int WriteProcFile(const char* path, const char* value) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return errno;
  ssize_t len = strlen(value);
  int err = write(fd, value, len) == len ? 0 : errno;
  close(fd);
  return err;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  argv_.clear();
  argv_.push_back(const_cast<char*>(options.executable.c_str()));  // NOLINT
  for (const std::string& arg : options.args) {
    argv_.push_back(const_cast<char*>(arg.c_str()));  // NOLINT
  }
  argv_.push_back(nullptr);
  cgroup_procs_.clear();
  if (!options.cgroup.empty()) cgroup_procs_ = options.cgroup + "/cgroup.procs";

  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  return Wait(info, error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: " + util::StrError(errno);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: " + util::StrError(errno);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the watchdog can kill every descendant at once.
  if (setsid() == -1) die("setsid", errno);

  // Join the cgroup while we still own the cgroup.procs file.
  if (!cgroup_procs_.empty()) {
    int err = WriteProcFile(cgroup_procs_.c_str(), "0");
    if (err != 0) die("cgroup", err);
  }

  if (options_->isolate_network) {
    uid_t uid = getuid();
    gid_t gid = getgid();
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) die("unshare", errno);
    char map[64] = {};
    int err = WriteProcFile("/proc/self/setgroups", "deny");
    if (err != 0) die("setgroups", err);
    FormatIdMap(uid, map, sizeof(map));
    err = WriteProcFile("/proc/self/uid_map", map);
    if (err != 0) die("uid_map", err);
    FormatIdMap(gid, map, sizeof(map));
    err = WriteProcFile("/proc/self/gid_map", map);
    if (err != 0) die("gid_map", err);
  }

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  stdin_fd = open(options_->stdin_file.empty() ? "/dev/null"
                                               : options_->stdin_file.c_str(),
                  O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);
#undef SET_RLIM

  execv(options_->executable.c_str(), argv_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  ssize_t num_read = 0;
  do {
    num_read = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (num_read == -1 && errno == EINTR);
  if (num_read == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t got = read(pipe_fds_[0], error, error_len);
    close(pipe_fds_[0]);
    *error_msg = got > 0 ? std::string(error, got) : "child setup failed";
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  if (options_->on_start) options_->on_start(child_pid_);

  pid_t pgid = child_pid_;
  util::Watchdog watchdog(options_->wall_limit_millis, [pgid]() {
    KJ_LOG(INFO, "Wall time limit exceeded, killing process group", pgid);
    kill(-pgid, SIGKILL);
  });

  // Wait without reaping, so that the process group cannot be recycled while
  // the watchdog may still signal it.
  siginfo_t si{};
  int ret = 0;
  while ((ret = waitid(P_PID, child_pid_, &si, WEXITED | WNOWAIT)) == -1 &&
         errno == EINTR) {
  }
  if (ret == -1) {
    *error_msg = "waitid: " + util::StrError(errno);
    kill(-pgid, SIGKILL);
  }
  watchdog.Cancel();
  // Leftover descendants do not outlive the program.
  kill(-pgid, SIGKILL);
  if (options_->on_exit) options_->on_exit(child_pid_);

  int child_status = 0;
  struct rusage rusage {};
  pid_t reaped = 0;
  while ((reaped = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
         errno == EINTR) {
  }
  if (reaped != child_pid_) {
    if (error_msg->empty()) *error_msg = "wait4: " + util::StrError(errno);
    return false;
  }
  if (ret == -1) return false;

  info->wall_time_millis = elapsed_millis();
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  // A program that exited on its own just before the deadline did not time
  // out, even if the watchdog fired.
  info->timed_out = watchdog.Expired() && info->signal == SIGKILL;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->timed_out) {
    info->message = "Wall time limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
