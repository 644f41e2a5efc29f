#ifndef ISOLATION_RESOURCE_GOVERNOR_HPP
#define ISOLATION_RESOURCE_GOVERNOR_HPP

#include <cstdint>
#include <string>

#include "absl/types/optional.h"
#include "core/execution_result.hpp"
#include "isolation/isolated_environment.hpp"

namespace isolation {

// Applies quotas to, and samples the usage of, a live environment. None of
// the functions throw: failures are reported by returning false and setting
// error_msg, and leave the environment unchanged. Callers must serialize
// calls on the same environment.
class ResourceGovernor {
 public:
  // Caps CPU usage to cpu_fraction of one CPU, at most the number of online
  // CPUs.
  static bool SetCpuLimit(IsolatedEnvironment* env, double cpu_fraction,
                          std::string* error_msg);
  static bool SetMemoryLimit(IsolatedEnvironment* env, int64_t memory_limit_mb,
                             std::string* error_msg);

  // Percentages are rounded to two decimal places. The CPU percentage is
  // computed over the interval since the previous sample, and is 0 for the
  // first one.
  static bool Sample(IsolatedEnvironment* env, core::ResourceSnapshot* usage,
                     std::string* error_msg);

  static double CpuPercent(const absl::optional<CpuBaseline>& previous,
                           const CpuBaseline& current);
  static double MemoryPercent(int64_t memory_usage_bytes,
                              int64_t memory_limit_mb);

  // Total CPU time spent by the host, from /proc/stat.
  static bool SystemCpuMicros(int64_t* micros, std::string* error_msg);
};

}  // namespace isolation

#endif
