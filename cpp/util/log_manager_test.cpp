#include "util/log_manager.hpp"
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

const std::string test_tmpdir = "/tmp/runbox_testdir";

// NOLINTNEXTLINE
TEST(LogManager, WritesToLogFile) {
  util::TempDir tmp(test_tmpdir + "/log");
  Flags::log_file = tmp.Path() + "/runbox.log";
  {
    util::LogManager log_manager(kj::LogSeverity::WARNING);
    KJ_LOG(WARNING, "environment leaked", 42);
    KJ_LOG(INFO, "not interesting");
  }
  std::string log = util::File::Read(Flags::log_file);
  EXPECT_THAT(log, HasSubstr("environment leaked"));
  EXPECT_THAT(log, HasSubstr("42"));
  EXPECT_THAT(log, HasSubstr("log_manager_test.cpp"));
  EXPECT_THAT(log, Not(HasSubstr("not interesting")));
  Flags::log_file = "";
}

}  // namespace
