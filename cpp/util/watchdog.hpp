#ifndef UTIL_WATCHDOG_HPP
#define UTIL_WATCHDOG_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include <kj/common.h>

namespace util {

// Calls on_expire from a dedicated thread once timeout_millis have elapsed,
// unless Cancel is called first. A timeout of 0 disables the watchdog. The
// destructor cancels the watchdog and waits for its thread.
class Watchdog {
 public:
  Watchdog(int64_t timeout_millis, std::function<void()> on_expire);
  ~Watchdog();
  KJ_DISALLOW_COPY(Watchdog);

  // After Cancel returns, on_expire is either finished or will never run.
  void Cancel();

  // Whether on_expire has been called.
  bool Expired() const { return expired_; }

 private:
  void Run(std::chrono::steady_clock::time_point deadline);

  std::function<void()> on_expire_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::atomic<bool> expired_{false};
  std::thread thread_;
};

}  // namespace util

#endif
