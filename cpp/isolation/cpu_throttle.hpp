#ifndef ISOLATION_CPU_THROTTLE_HPP
#define ISOLATION_CPU_THROTTLE_HPP

#include <sys/types.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include <kj/common.h>

namespace isolation {

// Approximates a CPU bandwidth quota for a process group that is not in a
// cgroup. A dedicated thread compares the CPU time read by read_cpu with
// cpu_fraction of the elapsed wall time (plus one period of burst), and keeps
// the whole group stopped with SIGSTOP while it is ahead of its share.
class CpuThrottle {
 public:
  // Returns false once the CPU time can no longer be read.
  using CpuReader = std::function<bool(int64_t* micros)>;

  static const constexpr int64_t kPeriodMicros = 100000;

  CpuThrottle(pid_t pgid, double cpu_fraction, CpuReader read_cpu);
  ~CpuThrottle();
  KJ_DISALLOW_COPY(CpuThrottle);

  // Applies a new fraction from now on.
  void SetFraction(double cpu_fraction);

  // Stops throttling and resumes the group if it is stopped. After Stop
  // returns, no further signal is sent.
  void Stop();

  // Number of times the group was stopped.
  int64_t Pauses();

 private:
  void Run();

  pid_t pgid_;
  CpuReader read_cpu_;
  std::mutex mutex_;
  std::condition_variable cv_;
  double cpu_fraction_;
  bool rebase_ = true;
  bool stopped_ = false;
  int64_t pauses_ = 0;
  std::thread thread_;
};

}  // namespace isolation

#endif
