#include "isolation/cpu_throttle.hpp"

#include <signal.h>
#include <utility>

#include <kj/debug.h>

namespace isolation {
namespace {
const constexpr auto kSlice = std::chrono::milliseconds(10);
}  // namespace

CpuThrottle::CpuThrottle(pid_t pgid, double cpu_fraction, CpuReader read_cpu)
    : pgid_(pgid), read_cpu_(std::move(read_cpu)), cpu_fraction_(cpu_fraction) {
  thread_ = std::thread(&CpuThrottle::Run, this);
}

CpuThrottle::~CpuThrottle() { Stop(); }

void CpuThrottle::SetFraction(double cpu_fraction) {
  std::lock_guard<std::mutex> lck(mutex_);
  cpu_fraction_ = cpu_fraction;
  rebase_ = true;
}

void CpuThrottle::Stop() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

int64_t CpuThrottle::Pauses() {
  std::lock_guard<std::mutex> lck(mutex_);
  return pauses_;
}

void CpuThrottle::Run() {
  std::chrono::steady_clock::time_point start_wall;
  int64_t start_cpu = 0;
  std::unique_lock<std::mutex> lck(mutex_);
  while (!stopped_) {
    if (rebase_) {
      start_wall = std::chrono::steady_clock::now();
      if (!read_cpu_(&start_cpu)) return;
      rebase_ = false;
    }
    if (cv_.wait_for(lck, kSlice, [this]() { return stopped_; })) return;
    int64_t cpu = 0;
    if (!read_cpu_(&cpu)) return;
    int64_t elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - start_wall)
                          .count();
    double allowed = cpu_fraction_ * (elapsed + kPeriodMicros);
    double excess = (cpu - start_cpu) - allowed;
    if (excess <= 0 || cpu_fraction_ <= 0) continue;
    // Stopped until the share catches up with the time already used.
    auto pause = std::chrono::microseconds(
        static_cast<int64_t>(excess / cpu_fraction_));
    if (kill(-pgid_, SIGSTOP) == -1) return;
    pauses_++;
    cv_.wait_for(lck, pause, [this]() { return stopped_; });
    if (kill(-pgid_, SIGCONT) == -1) {
      KJ_LOG(WARNING, "Cannot resume throttled process group", pgid_);
      return;
    }
  }
}

}  // namespace isolation
