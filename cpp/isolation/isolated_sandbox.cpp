#include "isolation/isolated_sandbox.hpp"

#include <unistd.h>
#include <system_error>
#include <utility>

#include <kj/debug.h>
#include "absl/strings/str_cat.h"
#include "core/script.hpp"
#include "isolation/resource_governor.hpp"

namespace isolation {

const char* StateName(State state) {
  switch (state) {
    case State::UNINITIALIZED:
      return "Uninitialized";
    case State::PROVISIONING:
      return "Provisioning";
    case State::READY:
      return "Ready";
    case State::EXECUTING:
      return "Executing";
    case State::TERMINATING:
      return "Terminating";
    case State::DESTROYED:
      return "Destroyed";
    case State::PROVISION_FAILED:
      return "ProvisionFailed";
    case State::TEARDOWN_FAILED:
      return "TeardownFailed";
  }
  return "Unknown";
}

std::atomic<uint64_t> IsolatedSandbox::next_id_{0};

IsolatedSandbox::IsolatedSandbox(SandboxConfig config,
                                 std::unique_ptr<Environment> backend)
    : config_(std::move(config)) {
  env_.id = absl::StrCat(config_.name_prefix, "-", getpid(), "-", next_id_++);
  env_.limits = config_.limits;
  env_.timeout_millis = config_.timeout_millis;
  env_.backend = std::move(backend);
}

IsolatedSandbox::~IsolatedSandbox() {
  State state = GetState();
  if (state == State::UNINITIALIZED || state == State::DESTROYED ||
      state == State::TEARDOWN_FAILED) {
    return;
  }
  std::string error;
  if (!Teardown(&error)) {
    KJ_LOG(ERROR, "Leaked isolated environment", env_.id, error);
  }
}

bool IsolatedSandbox::Provision(std::string* error_msg) {
  Environment* backend = nullptr;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (env_.state != State::UNINITIALIZED) {
      *error_msg = absl::StrCat("cannot provision an environment in state ",
                                StateName(env_.state));
      return false;
    }
    env_.state = State::PROVISIONING;
    if (env_.backend == nullptr) env_.backend = Environment::Create();
    if (env_.backend == nullptr) {
      env_.state = State::PROVISION_FAILED;
      *error_msg = "No isolated environment is available on this host";
      return false;
    }
    backend = env_.backend.get();
  }

  EnvironmentConfig config;
  config.name = env_.id;
  config.limits = env_.limits;
  config.interpreter = config_.interpreter;
  config.temp_directory = config_.temp_directory;
  bool ok = false;
  try {
    ok = backend->Provision(config, error_msg);
  } catch (const kj::Exception& exc) {
    *error_msg = exc.getDescription().cStr();
  } catch (const std::exception& exc) {
    *error_msg = exc.what();
  }

  std::lock_guard<std::mutex> lck(mutex_);
  env_.state = ok ? State::READY : State::PROVISION_FAILED;
  if (ok) {
    KJ_LOG(INFO, "Provisioned isolated environment", env_.id,
           env_.limits.memory_limit_mb, env_.limits.cpu_fraction);
  } else {
    KJ_LOG(WARNING, "Failed to provision isolated environment", env_.id,
           *error_msg);
  }
  return ok;
}

core::ExecutionResult IsolatedSandbox::ExecuteInEnvironment(
    const std::string& source, absl::optional<int64_t> timeout_millis) {
  Environment* backend = nullptr;
  int64_t timeout = 0;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (env_.state != State::READY) {
      core::ExecutionResult result = core::ExecutionResult::Failure(
          core::ErrorKind::INTERNAL,
          absl::StrCat("Isolated environment is not ready (state: ",
                       StateName(env_.state), ")"));
      result.isolated = true;
      return result;
    }
    env_.state = State::EXECUTING;
    backend = env_.backend.get();
    timeout = timeout_millis ? *timeout_millis : env_.timeout_millis;
  }

  core::ExecutionResult result;
  try {
    core::Script script(backend->Workspace(), source);
    sandbox::ExecutionInfo info;
    std::string error_msg;
    bool started = backend->Run(script.Options(backend->Interpreter(), timeout),
                                &info, &error_msg);
    result = script.Collect(started, info, error_msg, timeout);
  } catch (const kj::Exception& exc) {
    result = core::ExecutionResult::Failure(
        core::ErrorKind::INTERNAL, exc.getDescription().cStr());
  } catch (const std::exception& exc) {
    result = core::ExecutionResult::Failure(core::ErrorKind::INTERNAL,
                                            exc.what());
  }
  result.isolated = true;

  std::lock_guard<std::mutex> lck(mutex_);
  // A concurrent teardown owns the state from here on.
  if (env_.state == State::EXECUTING) {
    if (backend->Usable()) {
      env_.state = State::READY;
    } else {
      KJ_LOG(WARNING, "Isolated environment became unusable", env_.id);
      env_.state = State::TERMINATING;
    }
  }
  return result;
}

bool IsolatedSandbox::Teardown(std::string* error_msg) {
  Environment* backend = nullptr;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    switch (env_.state) {
      case State::UNINITIALIZED:
      case State::DESTROYED:
        return true;
      case State::TEARDOWN_FAILED:
        *error_msg = "teardown already failed";
        return false;
      case State::PROVISIONING:
        *error_msg = "environment is being provisioned";
        return false;
      case State::PROVISION_FAILED:
        backend = env_.backend.get();
        break;
      case State::READY:
      case State::EXECUTING:
      case State::TERMINATING:
        env_.state = State::TERMINATING;
        backend = env_.backend.get();
        break;
    }
  }
  if (backend == nullptr) return true;

  bool ok = false;
  try {
    ok = backend->Destroy(error_msg);
  } catch (const kj::Exception& exc) {
    *error_msg = exc.getDescription().cStr();
  } catch (const std::exception& exc) {
    *error_msg = exc.what();
  }

  std::lock_guard<std::mutex> lck(mutex_);
  if (!ok) {
    KJ_LOG(ERROR, "Failed to tear down isolated environment", env_.id,
           *error_msg);
  }
  if (env_.state == State::TERMINATING) {
    env_.state = ok ? State::DESTROYED : State::TEARDOWN_FAILED;
  } else if (env_.state == State::PROVISION_FAILED && ok) {
    env_.backend.reset();
  }
  if (ok) KJ_LOG(INFO, "Destroyed isolated environment", env_.id);
  return ok;
}

bool IsolatedSandbox::Usage(core::ResourceSnapshot* usage,
                            std::string* error_msg) {
  std::lock_guard<std::mutex> lck(mutex_);
  return ResourceGovernor::Sample(&env_, usage, error_msg);
}

bool IsolatedSandbox::UpdateLimits(absl::optional<int64_t> memory_limit_mb,
                                   absl::optional<double> cpu_fraction,
                                   std::string* error_msg) {
  std::lock_guard<std::mutex> lck(mutex_);
  bool ok = true;
  std::string memory_error;
  if (memory_limit_mb &&
      !ResourceGovernor::SetMemoryLimit(&env_, *memory_limit_mb,
                                        &memory_error)) {
    *error_msg = memory_error;
    ok = false;
  }
  std::string cpu_error;
  if (cpu_fraction &&
      !ResourceGovernor::SetCpuLimit(&env_, *cpu_fraction, &cpu_error)) {
    *error_msg = ok ? cpu_error : absl::StrCat(*error_msg, "; ", cpu_error);
    ok = false;
  }
  return ok;
}

State IsolatedSandbox::GetState() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return env_.state;
}

Limits IsolatedSandbox::GetLimits() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return env_.limits;
}

ScopedEnvironment::ScopedEnvironment(IsolatedSandbox* sandbox)
    : sandbox_(sandbox) {
  State state = sandbox_->GetState();
  if (state == State::UNINITIALIZED) {
    ready_ = sandbox_->Provision(&error_);
  } else {
    ready_ = state == State::READY;
    if (!ready_) {
      error_ = absl::StrCat("environment is ", StateName(state));
    }
  }
}

ScopedEnvironment::~ScopedEnvironment() {
  std::string error;
  if (!sandbox_->Teardown(&error)) {
    KJ_LOG(ERROR, "Scoped teardown failed", sandbox_->Id(), error);
  }
}

}  // namespace isolation
