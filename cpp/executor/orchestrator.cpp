#include "executor/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <utility>

#include <kj/debug.h>
#include "absl/strings/str_cat.h"
#include "syntax/syntax_gate.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace executor {
namespace {

const constexpr int64_t EXP_BACKOFF_MIN = 1;
const constexpr int64_t EXP_BACKOFF_MAX = 60000;

const constexpr auto kMonitorInterval = std::chrono::milliseconds(100);

// Longest deadline a request may ask for.
const constexpr double kMaxTimeoutSeconds = 24 * 3600;

core::ExecutionResult Internal(std::string error) {
  return core::ExecutionResult::Failure(core::ErrorKind::INTERNAL,
                                        std::move(error));
}

// Samples a sandbox periodically from a dedicated thread and keeps the
// largest values seen.
class UsageMonitor {
 public:
  explicit UsageMonitor(isolation::IsolatedSandbox* sandbox)
      : sandbox_(sandbox), thread_([this]() { Run(); }) {}
  ~UsageMonitor() { Stop(); }
  KJ_DISALLOW_COPY(UsageMonitor);

  void Stop() {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  // Folds a sample into the peak.
  void Add(const core::ResourceSnapshot& usage) {
    std::lock_guard<std::mutex> lck(mutex_);
    if (!peak_) {
      peak_ = usage;
      return;
    }
    peak_->cpu_percent = std::max(peak_->cpu_percent, usage.cpu_percent);
    peak_->memory_mb = std::max(peak_->memory_mb, usage.memory_mb);
    peak_->memory_percent =
        std::max(peak_->memory_percent, usage.memory_percent);
  }

  absl::optional<core::ResourceSnapshot> Peak() {
    std::lock_guard<std::mutex> lck(mutex_);
    return peak_;
  }

 private:
  void Run() {
    std::unique_lock<std::mutex> lck(mutex_);
    while (!cv_.wait_for(lck, kMonitorInterval, [this] { return stopped_; })) {
      lck.unlock();
      core::ResourceSnapshot usage;
      std::string error;
      if (sandbox_->Usage(&usage, &error)) {
        Add(usage);
      } else {
        KJ_LOG(INFO, "Usage sample failed", error);
      }
      lck.lock();
    }
  }

  isolation::IsolatedSandbox* sandbox_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
  absl::optional<core::ResourceSnapshot> peak_;
  std::thread thread_;
};

}  // namespace

OrchestratorConfig OrchestratorConfig::FromFlags() {
  OrchestratorConfig config;
  config.isolate = Flags::isolate;
  config.default_timeout_millis = util::SecondsToMillis(Flags::timeout_seconds);
  config.memory_limit_mb = Flags::memory_limit_mb;
  config.cpu_fraction = Flags::cpu_limit;
  config.interpreter = Flags::interpreter;
  config.temp_directory = Flags::temp_directory;
  config.keep_environment = Flags::keep_environment;
  config.provision_attempts = Flags::provision_attempts;
  return config;
}

ExecutionOrchestrator::ExecutionOrchestrator(OrchestratorConfig config,
                                             std::unique_ptr<DirectExecutor> direct,
                                             SandboxFactory sandbox_factory)
    : config_(std::move(config)),
      direct_(std::move(direct)),
      sandbox_factory_(std::move(sandbox_factory)) {
  if (!direct_) {
    direct_ = std::make_unique<DirectExecutor>(config_.interpreter,
                                               config_.temp_directory);
  }
  if (!sandbox_factory_) {
    sandbox_factory_ = [](const isolation::SandboxConfig& sandbox_config) {
      return std::make_unique<isolation::IsolatedSandbox>(sandbox_config);
    };
  }
}

ExecutionOrchestrator::~ExecutionOrchestrator() {
  core::ExecutionResult closed = Close();
  if (!closed.success) {
    KJ_LOG(ERROR, "Failed to close the orchestrator", *closed.error);
  }
}

core::ExecutionResult ExecutionOrchestrator::Execute(
    const core::ExecutionRequest& request) {
  return Dispatch(request, /*monitor=*/false);
}

core::ExecutionResult ExecutionOrchestrator::ExecuteWithMonitoring(
    const core::ExecutionRequest& request) {
  if (!request.isolate.value_or(config_.isolate)) {
    return Internal("Monitoring requires an isolated environment");
  }
  return Dispatch(request, /*monitor=*/true);
}

core::ExecutionResult ExecutionOrchestrator::Dispatch(
    const core::ExecutionRequest& request, bool monitor) {
  try {
    syntax::ValidationOutcome outcome =
        syntax::SyntaxGate::Validate(request.source);
    if (!outcome.valid) {
      KJ_LOG(INFO, "Rejected invalid program", outcome.Describe());
      return core::ExecutionResult::Failure(core::ErrorKind::SYNTAX,
                                            outcome.Describe());
    }
    int64_t timeout_millis = config_.default_timeout_millis;
    if (request.timeout_seconds) {
      if (!(*request.timeout_seconds > 0)) {
        return Internal(absl::StrCat("Invalid timeout ",
                                     *request.timeout_seconds,
                                     ": it must be positive"));
      }
      // Also rejects infinity.
      if (!(*request.timeout_seconds <= kMaxTimeoutSeconds)) {
        return Internal(absl::StrCat("Invalid timeout ",
                                     *request.timeout_seconds,
                                     ": it must be at most ",
                                     kMaxTimeoutSeconds, " seconds"));
      }
      timeout_millis = util::SecondsToMillis(*request.timeout_seconds);
    }

    core::ExecutionResult result =
        request.isolate.value_or(config_.isolate) || monitor
            ? RunIsolated(request.source, timeout_millis, monitor)
            : direct_->Run(request.source, timeout_millis);
    KJ_LOG(INFO, "Execution finished", core::Describe(result));
    return result;
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.getDescription());
    return Internal(exc.getDescription().cStr());
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.what());
    return Internal(exc.what());
  }
}

std::unique_ptr<isolation::IsolatedSandbox>
ExecutionOrchestrator::AcquireSandbox(std::string* error_msg) {
  isolation::SandboxConfig sandbox_config;
  {
    std::lock_guard<std::mutex> lck(sandbox_mutex_);
    sandbox_config.limits.memory_limit_mb = config_.memory_limit_mb;
    sandbox_config.limits.cpu_fraction = config_.cpu_fraction;
  }
  sandbox_config.timeout_millis = config_.default_timeout_millis;
  sandbox_config.interpreter = config_.interpreter;
  sandbox_config.temp_directory = config_.temp_directory;

  int32_t attempts = std::max(config_.provision_attempts, 1);
  int64_t sleep_time = 0;
  std::unique_ptr<isolation::IsolatedSandbox> sandbox;
  for (int32_t attempt = 1; attempt <= attempts; attempt++) {
    if (sandbox) {
      // Releases what the failed attempt created.
      std::string error;
      if (!sandbox->Teardown(&error)) {
        KJ_LOG(WARNING, "Cleanup after failed provisioning", error);
      }
      sleep_time = std::min(std::max(sleep_time * 2, EXP_BACKOFF_MIN),
                            EXP_BACKOFF_MAX);
      KJ_LOG(INFO, "Sleeping for", sleep_time, "ms");
      std::this_thread::sleep_for(std::chrono::milliseconds(sleep_time));
    }
    sandbox = sandbox_factory_(sandbox_config);
    if (sandbox->Provision(error_msg)) return sandbox;
    KJ_LOG(WARNING, "Provisioning failed", attempt, attempts, *error_msg);
  }
  return sandbox;
}

void ExecutionOrchestrator::AddLive(isolation::IsolatedSandbox* sandbox) {
  std::lock_guard<std::mutex> lck(sandbox_mutex_);
  live_.insert(sandbox);
}

void ExecutionOrchestrator::RemoveLive(isolation::IsolatedSandbox* sandbox) {
  std::lock_guard<std::mutex> lck(sandbox_mutex_);
  live_.erase(sandbox);
}

core::ExecutionResult ExecutionOrchestrator::RunIsolated(
    const std::string& source, int64_t timeout_millis, bool monitor) {
  if (config_.keep_environment) {
    std::lock_guard<std::mutex> exec_lck(exec_mutex_);
    if (!kept_) {
      std::string error;
      std::unique_ptr<isolation::IsolatedSandbox> sandbox =
          AcquireSandbox(&error);
      if (sandbox->GetState() != isolation::State::READY) {
        std::string cleanup_error;
        if (!sandbox->Teardown(&cleanup_error)) {
          KJ_LOG(WARNING, "Cleanup after failed provisioning", cleanup_error);
        }
        return Internal(absl::StrCat(
            "Failed to provision an isolated environment: ", error));
      }
      std::lock_guard<std::mutex> lck(sandbox_mutex_);
      kept_ = std::move(sandbox);
      live_.insert(kept_.get());
    }
    core::ExecutionResult result =
        RunIn(kept_.get(), source, timeout_millis, monitor);
    if (kept_->GetState() != isolation::State::READY) {
      // Replaced on the next call.
      core::ExecutionResult closed = CloseLocked();
      if (!closed.success) KJ_LOG(ERROR, *closed.error);
    }
    return result;
  }

  std::string error;
  std::unique_ptr<isolation::IsolatedSandbox> sandbox = AcquireSandbox(&error);
  isolation::ScopedEnvironment scope(sandbox.get());
  if (!scope.Ready()) {
    return Internal(absl::StrCat(
        "Failed to provision an isolated environment: ", error));
  }
  // Leaves live_ before scope tears it down.
  AddLive(sandbox.get());
  KJ_DEFER(RemoveLive(sandbox.get()));
  return RunIn(sandbox.get(), source, timeout_millis, monitor);
}

core::ExecutionResult ExecutionOrchestrator::RunIn(
    isolation::IsolatedSandbox* sandbox, const std::string& source,
    int64_t timeout_millis, bool monitor) {
  core::ResourceSnapshot usage;
  std::string error;
  // The first sample sets the CPU baseline.
  if (!sandbox->Usage(&usage, &error)) {
    KJ_LOG(INFO, "Usage sample failed", error);
  }
  core::ExecutionResult result;
  absl::optional<core::ResourceSnapshot> peak;
  if (monitor) {
    UsageMonitor monitor_thread(sandbox);
    result = sandbox->ExecuteInEnvironment(source, timeout_millis);
    monitor_thread.Stop();
    if (sandbox->Usage(&usage, &error)) monitor_thread.Add(usage);
    peak = monitor_thread.Peak();
  } else {
    result = sandbox->ExecuteInEnvironment(source, timeout_millis);
    if (sandbox->Usage(&usage, &error)) peak = usage;
  }
  if (peak) {
    result.resource_usage = peak;
  } else {
    KJ_LOG(INFO, "No usage available for the execution", error);
  }
  return result;
}

LimitsUpdate ExecutionOrchestrator::UpdateLimits(
    absl::optional<int64_t> memory_limit_mb,
    absl::optional<double> cpu_fraction) {
  LimitsUpdate update;
  std::lock_guard<std::mutex> lck(sandbox_mutex_);
  if (memory_limit_mb && *memory_limit_mb <= 0) {
    update.error = absl::StrCat("invalid memory limit ", *memory_limit_mb);
  } else if (cpu_fraction && !(*cpu_fraction > 0)) {
    update.error = absl::StrCat("invalid CPU limit ", *cpu_fraction);
  } else {
    if (memory_limit_mb) config_.memory_limit_mb = *memory_limit_mb;
    if (cpu_fraction) config_.cpu_fraction = *cpu_fraction;
    update.success = true;
    for (isolation::IsolatedSandbox* sandbox : live_) {
      std::string error;
      if (!sandbox->UpdateLimits(memory_limit_mb, cpu_fraction, &error)) {
        update.error = update.success
                           ? error
                           : absl::StrCat(update.error, "; ", error);
        update.success = false;
      }
    }
  }
  update.memory_limit_mb = config_.memory_limit_mb;
  update.cpu_fraction = config_.cpu_fraction;
  return update;
}

core::ExecutionResult ExecutionOrchestrator::Close() {
  std::lock_guard<std::mutex> lck(exec_mutex_);
  return CloseLocked();
}

core::ExecutionResult ExecutionOrchestrator::CloseLocked() {
  std::unique_ptr<isolation::IsolatedSandbox> kept;
  {
    std::lock_guard<std::mutex> lck(sandbox_mutex_);
    live_.erase(kept_.get());
    kept = std::move(kept_);
  }
  if (!kept) return core::ExecutionResult::Success("");
  std::string error;
  if (!kept->Teardown(&error)) {
    return core::ExecutionResult::Failure(
        core::ErrorKind::TEARDOWN_FAILED,
        absl::StrCat("Failed to tear down environment ", kept->Id(), ": ",
                     error));
  }
  return core::ExecutionResult::Success("");
}

}  // namespace executor
