#include "executor/orchestrator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "isolation/test/fake_environment.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

using ::testing::DoubleEq;
using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace executor;  // NOLINT

const std::string test_tmpdir = "/tmp/runbox_testdir";

// Direct executor that runs nothing and records its calls.
class CountingExecutor : public DirectExecutor {
 public:
  CountingExecutor() : DirectExecutor("python3", test_tmpdir) {}

  core::ExecutionResult Run(const std::string& source,
                            int64_t timeout_millis) const override {
    calls++;
    last_source = source;
    last_timeout_millis = timeout_millis;
    if (throw_on_run) throw std::runtime_error("boom");
    return core::ExecutionResult::Success("direct\n");
  }

  mutable int calls = 0;
  mutable std::string last_source;
  mutable int64_t last_timeout_millis = 0;
  bool throw_on_run = false;
};

// Holds calls whose source starts with "hold" until Release is called.
class Gate {
 public:
  void Enter() {
    std::unique_lock<std::mutex> lck(mutex_);
    held_++;
    cv_.notify_all();
    cv_.wait(lck, [this]() { return released_; });
  }

  bool WaitHeld(int count) {
    std::unique_lock<std::mutex> lck(mutex_);
    return cv_.wait_for(lck, std::chrono::seconds(5),
                        [this, count]() { return held_ >= count; });
  }

  void Release() {
    std::lock_guard<std::mutex> lck(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  int held_ = 0;
  bool released_ = false;
};

class HoldingExecutor : public DirectExecutor {
 public:
  explicit HoldingExecutor(Gate* gate)
      : DirectExecutor("python3", test_tmpdir), gate_(gate) {}

  core::ExecutionResult Run(const std::string& source,
                            int64_t /*timeout_millis*/) const override {
    if (source.compare(0, 4, "hold") == 0) gate_->Enter();
    return core::ExecutionResult::Success(source);
  }

 private:
  Gate* gate_;
};

class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest() : controls_(std::make_shared<isolation::FakeControls>()) {
    config_.interpreter = "/bin/sh";
    config_.temp_directory = test_tmpdir + "/orchestrator";
    config_.default_timeout_millis = 30000;
    config_.memory_limit_mb = 128;
    config_.cpu_fraction = 0.5;
    controls_->stdout_data = "isolated\n";
  }

  std::unique_ptr<ExecutionOrchestrator> Make() {
    auto direct = std::make_unique<CountingExecutor>();
    direct_ = direct.get();
    std::shared_ptr<isolation::FakeControls> controls = controls_;
    std::atomic<int>* sandboxes = &sandboxes_;
    return std::make_unique<ExecutionOrchestrator>(
        config_, std::move(direct),
        [controls, sandboxes](const isolation::SandboxConfig& config) {
          (*sandboxes)++;
          return std::make_unique<isolation::IsolatedSandbox>(
              config, std::make_unique<isolation::FakeEnvironment>(controls));
        });
  }

  static core::ExecutionRequest Request(const std::string& source) {
    core::ExecutionRequest request;
    request.source = source;
    return request;
  }

  OrchestratorConfig config_;
  std::shared_ptr<isolation::FakeControls> controls_;
  CountingExecutor* direct_ = nullptr;
  std::atomic<int> sandboxes_{0};
};

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, SyntaxErrorShortCircuits) {
  for (bool isolate : {false, true}) {
    config_.isolate = isolate;
    auto orchestrator = Make();
    core::ExecutionResult result =
        orchestrator->Execute(Request("print('unterminated"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, core::ErrorKind::SYNTAX);
    EXPECT_THAT(*result.error, StartsWith("Syntax error at line 1: "));
    EXPECT_FALSE(result.isolated);
    EXPECT_EQ(direct_->calls, 0);
  }
  EXPECT_EQ(sandboxes_, 0);
  EXPECT_EQ(controls_->provisions, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, DirectExecution) {
  config_.isolate = false;
  auto orchestrator = Make();
  core::ExecutionResult result = orchestrator->Execute(Request("print(1+1)"));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(*result.output, "direct\n");
  EXPECT_FALSE(result.isolated);
  EXPECT_EQ(direct_->calls, 1);
  EXPECT_EQ(direct_->last_source, "print(1+1)");
  EXPECT_EQ(direct_->last_timeout_millis, 30000);
  EXPECT_EQ(sandboxes_, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, TimeoutOverride) {
  config_.isolate = false;
  auto orchestrator = Make();
  core::ExecutionRequest request = Request("print(1)");
  request.timeout_seconds = 2;
  orchestrator->Execute(request);
  EXPECT_EQ(direct_->last_timeout_millis, 2000);

  request.timeout_seconds = 0;
  core::ExecutionResult result = orchestrator->Execute(request);
  EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL);
  EXPECT_EQ(*result.error, "Invalid timeout 0: it must be positive");
  EXPECT_EQ(direct_->calls, 1);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, UnboundedTimeoutRejected) {
  config_.isolate = false;
  auto orchestrator = Make();
  core::ExecutionRequest request = Request("print(1)");
  for (double timeout : {1e19, std::numeric_limits<double>::infinity(),
                         24 * 3600 + 1.0}) {
    request.timeout_seconds = timeout;
    core::ExecutionResult result = orchestrator->Execute(request);
    EXPECT_FALSE(result.success) << timeout;
    EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL) << timeout;
    EXPECT_THAT(*result.error, HasSubstr("it must be at most 86400 seconds"))
        << timeout;
  }
  EXPECT_EQ(direct_->calls, 0);

  request.timeout_seconds = 24 * 3600;
  EXPECT_TRUE(orchestrator->Execute(request).success);
  EXPECT_EQ(direct_->last_timeout_millis, 24 * 3600 * 1000);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, RequestHintOverridesRouting) {
  config_.isolate = true;
  auto orchestrator = Make();
  core::ExecutionRequest request = Request("print(1)");
  request.isolate = false;
  EXPECT_FALSE(orchestrator->Execute(request).isolated);
  EXPECT_EQ(direct_->calls, 1);
  EXPECT_EQ(sandboxes_, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, IsolatedExecutionTearsDown) {
  auto orchestrator = Make();
  controls_->counters.memory_usage_bytes = 32 * 1024 * 1024;
  core::ExecutionResult result = orchestrator->Execute(Request("print(1)"));
  EXPECT_TRUE(result.success) << core::Describe(result);
  EXPECT_EQ(*result.output, "isolated\n");
  EXPECT_TRUE(result.isolated);
  ASSERT_TRUE(result.resource_usage);
  EXPECT_THAT(result.resource_usage->memory_percent, DoubleEq(25));

  controls_->exit_code = 1;
  controls_->stderr_data = "Traceback\n";
  result = orchestrator->Execute(Request("raise ValueError()"));
  EXPECT_EQ(result.error_kind, core::ErrorKind::RUNTIME);
  EXPECT_TRUE(result.isolated);

  // A fresh environment per execution, always removed.
  EXPECT_EQ(sandboxes_, 2);
  EXPECT_EQ(controls_->provisions, 2);
  EXPECT_EQ(controls_->destroys, 2);
  EXPECT_EQ(direct_->calls, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, TeardownAfterLowerLayerFailure) {
  controls_->throw_on_run = true;
  auto orchestrator = Make();
  core::ExecutionResult result = orchestrator->Execute(Request("print(1)"));
  EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL);
  EXPECT_EQ(controls_->destroys, 1);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, ProvisionFailure) {
  controls_->provision_ok = false;
  config_.provision_attempts = 3;
  auto orchestrator = Make();
  core::ExecutionResult result = orchestrator->Execute(Request("print(1)"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL);
  EXPECT_EQ(*result.error,
            "Failed to provision an isolated environment: fake provisioning "
            "failure");
  EXPECT_EQ(controls_->provisions, 3);
  EXPECT_EQ(sandboxes_, 3);
  EXPECT_EQ(controls_->runs, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, TeardownFailureKeepsResult) {
  controls_->destroy_ok = false;
  auto orchestrator = Make();
  core::ExecutionResult result = orchestrator->Execute(Request("print(1)"));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(controls_->destroys, 1);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, LowerLayerExceptionIsInternal) {
  config_.isolate = false;
  auto orchestrator = Make();
  direct_->throw_on_run = true;
  core::ExecutionResult result = orchestrator->Execute(Request("print(1)"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL);
  EXPECT_EQ(*result.error, "boom");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, MonitoringRequiresIsolation) {
  config_.isolate = false;
  auto orchestrator = Make();
  core::ExecutionResult result =
      orchestrator->ExecuteWithMonitoring(Request("print(1)"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_kind, core::ErrorKind::INTERNAL);
  EXPECT_EQ(*result.error, "Monitoring requires an isolated environment");
  EXPECT_EQ(direct_->calls, 0);
  EXPECT_EQ(sandboxes_, 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, MonitoringReportsUsage) {
  auto orchestrator = Make();
  controls_->counters.memory_usage_bytes = 64 * 1024 * 1024;
  core::ExecutionResult result =
      orchestrator->ExecuteWithMonitoring(Request("print(1)"));
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.isolated);
  ASSERT_TRUE(result.resource_usage);
  EXPECT_THAT(result.resource_usage->memory_mb, DoubleEq(64));
  EXPECT_THAT(result.resource_usage->memory_percent, DoubleEq(50));
  EXPECT_EQ(controls_->destroys, 1);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, UpdateLimitsForFutureEnvironments) {
  auto orchestrator = Make();
  LimitsUpdate update = orchestrator->UpdateLimits(256, absl::nullopt);
  EXPECT_TRUE(update.success) << update.error;
  EXPECT_EQ(update.memory_limit_mb, 256);
  EXPECT_THAT(update.cpu_fraction, DoubleEq(0.5));

  orchestrator->Execute(Request("print(1)"));
  EXPECT_EQ(controls_->memory_limit_mb, 256);

  update = orchestrator->UpdateLimits(-1, absl::nullopt);
  EXPECT_FALSE(update.success);
  EXPECT_EQ(update.memory_limit_mb, 256);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, UpdateLimitsDuringExecution) {
  auto orchestrator = Make();
  LimitsUpdate during;
  ExecutionOrchestrator* raw = orchestrator.get();
  controls_->during_run = [raw, &during]() {
    during = raw->UpdateLimits(512, 0.25);
  };
  EXPECT_TRUE(orchestrator->Execute(Request("print(1)")).success);
  EXPECT_TRUE(during.success) << during.error;
  EXPECT_EQ(controls_->memory_limit_mb, 512);
  EXPECT_THAT(controls_->cpu_fraction, DoubleEq(0.25));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, DirectExecutionsDoNotWaitForEachOther) {
  config_.isolate = false;
  Gate gate;
  ExecutionOrchestrator orchestrator(
      config_, std::make_unique<HoldingExecutor>(&gate));
  auto held = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator.Execute(Request("hold = 1"));
  });
  ASSERT_TRUE(gate.WaitHeld(1));
  auto quick = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator.Execute(Request("print(1)"));
  });
  bool finished = quick.wait_for(std::chrono::seconds(5)) ==
                  std::future_status::ready;
  gate.Release();
  ASSERT_TRUE(finished);
  EXPECT_EQ(*quick.get().output, "print(1)");
  EXPECT_EQ(*held.get().output, "hold = 1");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, FreshEnvironmentsRunConcurrently) {
  Gate gate;
  std::atomic<bool> first{true};
  controls_->during_run = [&gate, &first]() {
    if (first.exchange(false)) gate.Enter();
  };
  auto orchestrator = Make();
  auto held = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator->Execute(Request("print(1)"));
  });
  ASSERT_TRUE(gate.WaitHeld(1));
  auto quick = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator->Execute(Request("print(2)"));
  });
  bool finished = quick.wait_for(std::chrono::seconds(5)) ==
                  std::future_status::ready;
  // Both environments are live: the update reaches each of them.
  LimitsUpdate update = orchestrator->UpdateLimits(300, absl::nullopt);
  gate.Release();
  ASSERT_TRUE(finished);
  EXPECT_TRUE(quick.get().success);
  EXPECT_TRUE(held.get().success);
  EXPECT_TRUE(update.success) << update.error;
  EXPECT_EQ(controls_->memory_limit_mb, 300);
  EXPECT_EQ(controls_->provisions, 2);
  EXPECT_EQ(controls_->destroys, 2);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, KeptEnvironmentIsSerialized) {
  config_.keep_environment = true;
  Gate gate;
  std::atomic<bool> first{true};
  controls_->during_run = [&gate, &first]() {
    if (first.exchange(false)) gate.Enter();
  };
  auto orchestrator = Make();
  auto held = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator->Execute(Request("print(1)"));
  });
  ASSERT_TRUE(gate.WaitHeld(1));
  auto second = std::async(std::launch::async, [&orchestrator]() {
    return orchestrator->Execute(Request("print(2)"));
  });
  EXPECT_EQ(second.wait_for(std::chrono::milliseconds(200)),
            std::future_status::timeout);
  gate.Release();
  EXPECT_TRUE(held.get().success);
  EXPECT_TRUE(second.get().success);
  EXPECT_EQ(controls_->provisions, 1);
  EXPECT_EQ(controls_->runs, 2);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, KeepEnvironment) {
  config_.keep_environment = true;
  auto orchestrator = Make();
  EXPECT_TRUE(orchestrator->Execute(Request("print(1)")).success);
  EXPECT_TRUE(orchestrator->Execute(Request("print(2)")).success);
  EXPECT_EQ(controls_->provisions, 1);
  EXPECT_EQ(controls_->runs, 2);
  EXPECT_EQ(controls_->destroys, 0);

  // Applied to the live environment.
  EXPECT_TRUE(orchestrator->UpdateLimits(200, absl::nullopt).success);
  EXPECT_EQ(controls_->memory_limit_mb, 200);

  EXPECT_TRUE(orchestrator->Close().success);
  EXPECT_EQ(controls_->destroys, 1);
  EXPECT_TRUE(orchestrator->Close().success);
  EXPECT_EQ(controls_->destroys, 1);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, KeepEnvironmentReplacedWhenUnusable) {
  config_.keep_environment = true;
  controls_->usable_after_run = false;
  auto orchestrator = Make();
  orchestrator->Execute(Request("print(1)"));
  EXPECT_EQ(controls_->destroys, 1);
  orchestrator->Execute(Request("print(1)"));
  EXPECT_EQ(controls_->provisions, 2);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, CloseFailure) {
  config_.keep_environment = true;
  controls_->destroy_ok = false;
  auto orchestrator = Make();
  EXPECT_TRUE(orchestrator->Execute(Request("print(1)")).success);
  core::ExecutionResult closed = orchestrator->Close();
  EXPECT_FALSE(closed.success);
  EXPECT_EQ(closed.error_kind, core::ErrorKind::TEARDOWN_FAILED);
  EXPECT_THAT(*closed.error, HasSubstr("fake teardown failure"));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, DestructorCloses) {
  config_.keep_environment = true;
  {
    auto orchestrator = Make();
    orchestrator->Execute(Request("print(1)"));
  }
  EXPECT_EQ(controls_->destroys, 1);
}

// NOLINTNEXTLINE
TEST(OrchestratorConfig, FromFlags) {
  Flags::isolate = false;
  Flags::timeout_seconds = 2.5;
  Flags::memory_limit_mb = 64;
  Flags::cpu_limit = 0.75;
  Flags::keep_environment = true;
  Flags::provision_attempts = 4;
  OrchestratorConfig config = OrchestratorConfig::FromFlags();
  EXPECT_FALSE(config.isolate);
  EXPECT_EQ(config.default_timeout_millis, 2500);
  EXPECT_EQ(config.memory_limit_mb, 64);
  EXPECT_THAT(config.cpu_fraction, DoubleEq(0.75));
  EXPECT_TRUE(config.keep_environment);
  EXPECT_EQ(config.provision_attempts, 4);
  EXPECT_EQ(config.interpreter, Flags::interpreter);
}

// NOLINTNEXTLINE
TEST(Orchestrator, EndToEndDirect) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 not found";
  OrchestratorConfig config;
  config.isolate = false;
  config.temp_directory = test_tmpdir + "/orchestrator";
  ExecutionOrchestrator orchestrator(config);
  core::ExecutionRequest request;
  request.source = "print(1+1)";
  core::ExecutionResult result = orchestrator.Execute(request);
  EXPECT_TRUE(result.success) << core::Describe(result);
  EXPECT_EQ(*result.output, "2\n");
  EXPECT_FALSE(result.isolated);

  request.source = "while True: pass";
  request.timeout_seconds = 1;
  result = orchestrator.Execute(request);
  EXPECT_EQ(result.error_kind, core::ErrorKind::TIMEOUT);
  EXPECT_EQ(*result.error, "Execution timed out after 1 seconds");
}

// NOLINTNEXTLINE
TEST(Orchestrator, ShortDeadlineNotDelayedByLongRun) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 not found";
  OrchestratorConfig config;
  config.isolate = false;
  config.temp_directory = test_tmpdir + "/orchestrator";
  ExecutionOrchestrator orchestrator(config);
  auto slow = std::async(std::launch::async, [&orchestrator]() {
    core::ExecutionRequest request;
    request.source = "while True: pass";
    request.timeout_seconds = 3;
    return orchestrator.Execute(request);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  core::ExecutionRequest request;
  request.source = "print(1)";
  request.timeout_seconds = 1;
  auto start = std::chrono::steady_clock::now();
  core::ExecutionResult result = orchestrator.Execute(request);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(result.success) << core::Describe(result);
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
  EXPECT_EQ(slow.get().error_kind, core::ErrorKind::TIMEOUT);
}

}  // namespace
