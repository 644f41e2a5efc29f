#include "isolation/resource_governor.hpp"

#include <unistd.h>
#include <system_error>

#include <kj/debug.h>
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace isolation {
namespace {
const constexpr double kMiB = 1024.0 * 1024.0;

bool CheckLive(const IsolatedEnvironment& env, std::string* error_msg) {
  if (env.backend == nullptr) {
    *error_msg = "environment has no backend";
    return false;
  }
  if (env.state != State::READY && env.state != State::EXECUTING) {
    *error_msg =
        absl::StrCat("environment is not live (", StateName(env.state), ")");
    return false;
  }
  return true;
}
}  // namespace

bool ResourceGovernor::SetCpuLimit(IsolatedEnvironment* env,
                                   double cpu_fraction,
                                   std::string* error_msg) {
  long cpus = sysconf(_SC_NPROCESSORS_ONLN);  // NOLINT
  if (!(cpu_fraction > 0 && cpu_fraction <= cpus)) {
    *error_msg = absl::StrCat("invalid CPU limit ", cpu_fraction);
    return false;
  }
  if (!CheckLive(*env, error_msg)) return false;
  if (!env->backend->ApplyCpuLimit(cpu_fraction, error_msg)) {
    KJ_LOG(WARNING, "Failed to update the CPU limit", env->id, *error_msg);
    return false;
  }
  env->limits.cpu_fraction = cpu_fraction;
  KJ_LOG(INFO, "CPU limit updated", env->id, cpu_fraction);
  return true;
}

bool ResourceGovernor::SetMemoryLimit(IsolatedEnvironment* env,
                                      int64_t memory_limit_mb,
                                      std::string* error_msg) {
  if (memory_limit_mb <= 0) {
    *error_msg = absl::StrCat("invalid memory limit ", memory_limit_mb);
    return false;
  }
  if (!CheckLive(*env, error_msg)) return false;
  if (!env->backend->ApplyMemoryLimit(memory_limit_mb, error_msg)) {
    KJ_LOG(WARNING, "Failed to update the memory limit", env->id, *error_msg);
    return false;
  }
  env->limits.memory_limit_mb = memory_limit_mb;
  KJ_LOG(INFO, "Memory limit updated", env->id, memory_limit_mb);
  return true;
}

bool ResourceGovernor::Sample(IsolatedEnvironment* env,
                              core::ResourceSnapshot* usage,
                              std::string* error_msg) {
  if (!CheckLive(*env, error_msg)) return false;
  Counters counters;
  CpuBaseline current;
  try {
    if (!env->backend->ReadCounters(&counters, error_msg)) return false;
    if (!SystemCpuMicros(&current.system_micros, error_msg)) return false;
  } catch (const kj::Exception& exc) {
    *error_msg = exc.getDescription().cStr();
    return false;
  } catch (const std::exception& exc) {
    *error_msg = exc.what();
    return false;
  }
  current.cpu_usage_micros = counters.cpu_usage_micros;
  usage->cpu_percent = CpuPercent(env->cpu_baseline, current);
  usage->memory_mb = util::Round(counters.memory_usage_bytes / kMiB);
  usage->memory_percent =
      MemoryPercent(counters.memory_usage_bytes, env->limits.memory_limit_mb);
  env->cpu_baseline = current;
  return true;
}

double ResourceGovernor::CpuPercent(const absl::optional<CpuBaseline>& previous,
                                    const CpuBaseline& current) {
  if (!previous) return 0;
  int64_t system_delta = current.system_micros - previous->system_micros;
  int64_t cpu_delta = current.cpu_usage_micros - previous->cpu_usage_micros;
  if (system_delta <= 0 || cpu_delta <= 0) return 0;
  return util::Round(100.0 * cpu_delta / system_delta);
}

double ResourceGovernor::MemoryPercent(int64_t memory_usage_bytes,
                                       int64_t memory_limit_mb) {
  if (memory_limit_mb <= 0) return 0;
  return util::Round(100.0 * memory_usage_bytes / (memory_limit_mb * kMiB));
}

bool ResourceGovernor::SystemCpuMicros(int64_t* micros,
                                       std::string* error_msg) {
  std::string stat;
  try {
    stat = util::File::Read("/proc/stat");
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  // First line: "cpu  user nice system idle iowait irq softirq steal ...",
  // in clock ticks. guest times are already included in user and nice.
  absl::string_view first = stat;
  first = first.substr(0, first.find('\n'));
  std::vector<absl::string_view> fields =
      absl::StrSplit(first, ' ', absl::SkipEmpty());
  if (fields.empty() || fields[0] != "cpu") {
    *error_msg = "malformed /proc/stat";
    return false;
  }
  int64_t ticks = 0;
  for (size_t i = 1; i < fields.size() && i <= 8; i++) {
    int64_t value = 0;
    if (!absl::SimpleAtoi(fields[i], &value)) {
      *error_msg = "malformed /proc/stat";
      return false;
    }
    ticks += value;
  }
  long hz = sysconf(_SC_CLK_TCK);  // NOLINT
  *micros = ticks * (1000000 / hz);
  return true;
}

}  // namespace isolation
