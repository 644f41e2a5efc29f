#include "isolation/cgroup_environment.hpp"
#include <unistd.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;

using namespace isolation;  // NOLINT

const std::string test_tmpdir = "/tmp/runbox_testdir";

// NOLINTNEXTLINE
TEST(CgroupEnvironment, UnavailableWithoutRoot) {
  std::string old_root = Flags::cgroup_root;
  Flags::cgroup_root = "/no/such/cgroup";
  EXPECT_LT(CgroupEnvironment::Score(), 0);
  Flags::cgroup_root = old_root;
}

class CgroupEnvironmentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (CgroupEnvironment::Score() < 0) {
      GTEST_SKIP() << "no delegated cgroup at " << Flags::cgroup_root;
    }
    if (util::which("python3").empty()) GTEST_SKIP() << "python3 not found";
    config_.name = "runbox-cgroup-test-" + std::to_string(getpid());
    config_.temp_directory = test_tmpdir + "/cgroup";
    config_.limits.memory_limit_mb = 128;
    config_.limits.cpu_fraction = 0.5;
    std::string error;
    ASSERT_TRUE(env_.Provision(config_, &error)) << error;
  }

  void TearDown() override {
    std::string error;
    EXPECT_TRUE(env_.Destroy(&error)) << error;
  }

  std::string Control(const std::string& name) {
    return util::File::Read(util::File::JoinPath(env_.Path(), name));
  }

  EnvironmentConfig config_;
  CgroupEnvironment env_;
};

// NOLINTNEXTLINE
TEST_F(CgroupEnvironmentTest, Limits) {
  EXPECT_EQ(Control("memory.max"), std::to_string(128 * 1024 * 1024) + "\n");
  EXPECT_EQ(Control("cpu.max"), "50000 100000\n");
  std::string error;
  ASSERT_TRUE(env_.ApplyMemoryLimit(256, &error)) << error;
  ASSERT_TRUE(env_.ApplyCpuLimit(0.25, &error)) << error;
  EXPECT_EQ(Control("memory.max"), std::to_string(256 * 1024 * 1024) + "\n");
  EXPECT_EQ(Control("cpu.max"), "25000 100000\n");
}

// NOLINTNEXTLINE
TEST_F(CgroupEnvironmentTest, RunAndCount) {
  std::string out = util::File::JoinPath(env_.Workspace(), "out");
  sandbox::ExecutionOptions options(env_.Workspace(), env_.Interpreter());
  options.args = {"-c", "print(sum(range(10**6)))"};
  options.stdout_file = out;
  options.wall_limit_millis = 10000;
  sandbox::ExecutionInfo info;
  std::string error;
  ASSERT_TRUE(env_.Run(options, &info, &error)) << error;
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(out), "499999500000\n");

  Counters counters;
  ASSERT_TRUE(env_.ReadCounters(&counters, &error)) << error;
  EXPECT_GT(counters.cpu_usage_micros, 0);
  EXPECT_TRUE(env_.Usable());
}

// NOLINTNEXTLINE
TEST_F(CgroupEnvironmentTest, MemoryLimitKills) {
  std::string err = util::File::JoinPath(env_.Workspace(), "err");
  sandbox::ExecutionOptions options(env_.Workspace(), env_.Interpreter());
  options.args = {"-c", "x = bytearray(512 * 1024 * 1024)"};
  options.stderr_file = err;
  options.wall_limit_millis = 10000;
  sandbox::ExecutionInfo info;
  std::string error;
  ASSERT_TRUE(env_.Run(options, &info, &error)) << error;
  EXPECT_TRUE(info.signal != 0 || info.status_code != 0);
}

}  // namespace
