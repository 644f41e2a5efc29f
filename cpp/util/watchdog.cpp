#include "util/watchdog.hpp"

#include <algorithm>

namespace util {
namespace {
// Longer timeouts are shortened to this, so that the deadline is
// representable.
const constexpr int64_t kMaxTimeoutMillis = 365LL * 24 * 3600 * 1000;
}  // namespace

Watchdog::Watchdog(int64_t timeout_millis, std::function<void()> on_expire)
    : on_expire_(std::move(on_expire)) {
  if (timeout_millis <= 0) return;
  timeout_millis = std::min(timeout_millis, kMaxTimeoutMillis);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_millis);
  thread_ = std::thread(&Watchdog::Run, this, deadline);
}

Watchdog::~Watchdog() { Cancel(); }

void Watchdog::Cancel() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Watchdog::Run(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lck(mutex_);
  if (cv_.wait_until(lck, deadline, [this]() { return cancelled_; })) return;
  expired_ = true;
  on_expire_();
}

}  // namespace util
