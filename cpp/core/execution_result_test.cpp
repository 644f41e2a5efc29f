#include "core/execution_result.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

using namespace core;  // NOLINT

// NOLINTNEXTLINE
TEST(ExecutionResult, Success) {
  ExecutionResult result = ExecutionResult::Success("2\n");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, absl::make_optional<std::string>("2\n"));
  EXPECT_FALSE(result.error);
  EXPECT_FALSE(result.error_kind);
  EXPECT_FALSE(result.isolated);
  EXPECT_FALSE(result.resource_usage);
}

// NOLINTNEXTLINE
TEST(ExecutionResult, Failure) {
  ExecutionResult result =
      ExecutionResult::Failure(ErrorKind::RUNTIME, "boom", std::string("x"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME);
  EXPECT_EQ(*result.error, "boom");
  EXPECT_EQ(*result.output, "x");
}

// NOLINTNEXTLINE
TEST(ExecutionResult, FailureAlwaysHasMessage) {
  ExecutionResult result = ExecutionResult::Failure(ErrorKind::INTERNAL, "");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(*result.error, "Internal error");
  EXPECT_FALSE(result.output);
}

// NOLINTNEXTLINE
TEST(ExecutionResult, KindNames) {
  EXPECT_STREQ(ErrorKindName(ErrorKind::SYNTAX), "Syntax");
  EXPECT_STREQ(ErrorKindName(ErrorKind::RUNTIME), "Runtime");
  EXPECT_STREQ(ErrorKindName(ErrorKind::TIMEOUT), "Timeout");
  EXPECT_STREQ(ErrorKindName(ErrorKind::INTERNAL), "Internal");
  EXPECT_STREQ(ErrorKindName(ErrorKind::TEARDOWN_FAILED), "TeardownFailed");
}

// NOLINTNEXTLINE
TEST(ExecutionResult, Describe) {
  ExecutionResult result =
      ExecutionResult::Failure(ErrorKind::TIMEOUT, "too slow");
  result.isolated = true;
  result.resource_usage = ResourceSnapshot{12.5, 3, 2.34};
  std::string text = Describe(result);
  EXPECT_THAT(text, HasSubstr("success: false"));
  EXPECT_THAT(text, HasSubstr("isolated: true"));
  EXPECT_THAT(text, HasSubstr("error_kind: Timeout"));
  EXPECT_THAT(text, HasSubstr("error: too slow"));
  EXPECT_THAT(text, HasSubstr("memory_percent: 2.34"));
  EXPECT_THAT(Describe(ExecutionResult::Success("ok")),
              Not(HasSubstr("error")));
}

}  // namespace
