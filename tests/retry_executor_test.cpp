#include "contentflow/resilience/retry_executor.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <stdexcept>
#include <string>

using namespace contentflow;
using namespace std::chrono_literals;
using contentflow::test::RecordingReporter;
using contentflow::test::RecordingSleeper;
using contentflow::test::run_coro;

namespace {

// Fails `failures` times with `error`, then returns `value`.
struct ScriptedOp {
  int *calls;
  int failures;
  Error error;
  int value;

  auto operator()() const -> task<Result<int>> {
    ++*calls;
    if (*calls <= failures) {
      co_return fail(error);
    }
    co_return value;
  }
};

class RetryExecutorTest : public ::testing::Test {
protected:
  auto make_executor(RetryConfig cfg = {}) -> RetryExecutor {
    return RetryExecutor(reporter_, std::move(cfg), sleeper_.fn());
  }

  RecordingReporter reporter_;
  RecordingSleeper sleeper_;
};

} // namespace

TEST(BackoffDelayTest, GrowsGeometricallyAndCaps) {
  RetryConfig cfg;
  cfg.base_delay = 100ms;
  cfg.backoff_factor = 2.0;
  cfg.max_delay = 300ms;
  EXPECT_EQ(backoff_delay(cfg, 1), 100ms);
  EXPECT_EQ(backoff_delay(cfg, 2), 200ms);
  EXPECT_EQ(backoff_delay(cfg, 3), 300ms);
  EXPECT_EQ(backoff_delay(cfg, 10), 300ms);
  EXPECT_EQ(backoff_delay(cfg, 0), 100ms);
}

TEST(RetryOverridesTest, OnlySetFieldsApply) {
  RetryConfig base;
  RetryOverrides o;
  o.max_attempts = 7;
  auto merged = o.apply(base);
  EXPECT_EQ(merged.max_attempts, 7);
  EXPECT_EQ(merged.base_delay, base.base_delay);
  EXPECT_EQ(merged.max_delay, base.max_delay);
  EXPECT_DOUBLE_EQ(merged.backoff_factor, base.backoff_factor);
}

TEST_F(RetryExecutorTest, SucceedsFirstTime) {
  auto exec = make_executor();
  int calls = 0;
  auto result = run_coro(exec.execute(
      "fetch", ScriptedOp{&calls, 0, Error::NetworkError, 11}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 11);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper_.delays.empty());
  EXPECT_TRUE(reporter_.reports.empty());
  EXPECT_FALSE(exec.is_retrying());
  EXPECT_EQ(exec.attempt_count(), 1);
}

TEST_F(RetryExecutorTest, BackoffGrowsAcrossTransientFailures) {
  RetryConfig cfg;
  cfg.max_attempts = 4;
  cfg.base_delay = 100ms;
  cfg.backoff_factor = 2.0;
  cfg.max_delay = 1000ms;
  auto exec = make_executor(cfg);

  int calls = 0;
  auto result = run_coro(exec.execute(
      "sync", ScriptedOp{&calls, 3, Error::NetworkError, 42}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(calls, 4);
  ASSERT_EQ(sleeper_.delays.size(), 3U);
  EXPECT_EQ(sleeper_.delays[0], 100ms);
  EXPECT_EQ(sleeper_.delays[1], 200ms);
  EXPECT_EQ(sleeper_.delays[2], 400ms);
  EXPECT_TRUE(reporter_.reports.empty());
  EXPECT_EQ(exec.attempt_count(), 4);
}

TEST_F(RetryExecutorTest, PermanentFailureShortCircuits) {
  auto exec = make_executor();
  int calls = 0;
  auto result = run_coro(exec.execute(
      "save", ScriptedOp{&calls, 99, Error::ValidationFailed, 0}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::ValidationFailed));
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper_.delays.empty());

  ASSERT_EQ(reporter_.reports.size(), 1U);
  EXPECT_EQ(reporter_.reports[0].context, "save failed: validation failed");
  EXPECT_EQ(reporter_.reports[0].meta.attempt, 1);
  EXPECT_FALSE(exec.is_retrying());
  ASSERT_TRUE(exec.last_error().has_value());
  EXPECT_EQ(exec.last_error()->code, make_error_code(Error::ValidationFailed));
}

TEST_F(RetryExecutorTest, ExhaustionReportsExactlyOnce) {
  auto exec = make_executor(test::fast_retry_config(3));
  int calls = 0;
  auto result = run_coro(exec.execute(
      "upload", ScriptedOp{&calls, 99, Error::Timeout, 0}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeper_.delays.size(), 2U);

  ASSERT_EQ(reporter_.reports.size(), 1U);
  EXPECT_EQ(reporter_.reports[0].context,
            "upload failed after 3 attempts: timeout");
  EXPECT_EQ(reporter_.reports[0].meta.attempt, 3);
  EXPECT_EQ(exec.attempt_count(), 3);
  EXPECT_FALSE(exec.is_retrying());
}

TEST_F(RetryExecutorTest, ThrownExceptionsBecomeFaults) {
  auto exec = make_executor(test::fast_retry_config(2));
  int calls = 0;
  auto result = run_coro(exec.execute("parse", [&calls]() -> task<Result<int>> {
    ++calls;
    throw std::runtime_error("unexpected token");
    co_return 0;
  }));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().detail, "unexpected token");
  // Unclassified text is not retried.
  EXPECT_EQ(calls, 1);
  ASSERT_EQ(reporter_.reports.size(), 1U);
  EXPECT_EQ(reporter_.reports[0].context, "parse failed: unexpected token");
}

TEST_F(RetryExecutorTest, ThrownTransientExceptionIsRetried) {
  auto exec = make_executor(test::fast_retry_config(3));
  int calls = 0;
  auto result = run_coro(exec.execute("poll", [&calls]() -> task<Result<int>> {
    if (++calls < 3) {
      throw std::runtime_error("network unreachable");
    }
    co_return 3;
  }));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 3);
  EXPECT_EQ(calls, 3);
  EXPECT_TRUE(reporter_.reports.empty());
}

TEST_F(RetryExecutorTest, EmptyNameFallsBackToOperation) {
  auto exec = make_executor();
  int calls = 0;
  (void)run_coro(
      exec.execute("", ScriptedOp{&calls, 99, Error::Forbidden, 0}));
  ASSERT_EQ(reporter_.reports.size(), 1U);
  EXPECT_EQ(reporter_.reports[0].context, "Operation failed: forbidden");
}

TEST_F(RetryExecutorTest, VoidOperations) {
  auto exec = make_executor();
  int calls = 0;
  auto result = run_coro(exec.execute("ping", [&calls]() -> task<Result<void>> {
    ++calls;
    co_return ok();
  }));
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryExecutorTest, ExecuteWithDoesNotChangeDefaults) {
  auto exec = make_executor(test::fast_retry_config(2));
  int calls = 0;
  RetryOverrides overrides;
  overrides.max_attempts = 5;
  auto result = run_coro(exec.execute_with(
      overrides, "long", ScriptedOp{&calls, 4, Error::ServerError, 1}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(calls, 5);
  EXPECT_EQ(exec.config().max_attempts, 2);

  calls = 0;
  auto second = run_coro(
      exec.execute("short", ScriptedOp{&calls, 4, Error::ServerError, 1}));
  EXPECT_FALSE(second.has_value());
  EXPECT_EQ(calls, 2);
}

TEST_F(RetryExecutorTest, CustomRetryConditionOverridesClassification) {
  auto exec = make_executor(test::fast_retry_config(3));
  RetryOverrides overrides;
  overrides.retry_condition = [](const Fault &f) {
    return f.code == make_error_code(Error::StorageError);
  };
  int calls = 0;
  auto result = run_coro(exec.execute_with(
      overrides, "write", ScriptedOp{&calls, 1, Error::StorageError, 9}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(calls, 2);
}

TEST_F(RetryExecutorTest, WithRetryWrapsAnOperation) {
  auto exec = make_executor(test::fast_retry_config(3));
  int calls = 0;
  auto wrapped =
      with_retry(exec, "wrapped", ScriptedOp{&calls, 1, Error::Offline, 8});

  auto first = run_coro(wrapped());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 8);
  EXPECT_EQ(calls, 2);

  auto second = run_coro(wrapped());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(calls, 3);
}
