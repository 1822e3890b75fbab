#include "contentflow/app/application.hpp"
#include "contentflow/util/file.hpp"
#include "contentflow/util/time.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <system_error>

using namespace contentflow;
using namespace std::chrono_literals;

namespace {

auto memory_config() -> ServiceConfig {
  ServiceConfig cfg;
  cfg.store.backend = StoreBackend::Memory;
  cfg.scheduler.check_on_start = false;
  cfg.retry.base_delay_ms = 0;
  cfg.retry.max_delay_ms = 0;
  return cfg;
}

auto file_config(const test::TempDir &dir) -> ServiceConfig {
  auto cfg = memory_config();
  cfg.store.backend = StoreBackend::File;
  cfg.store.data_file = dir.file("data.json").string();
  cfg.store.marker_file = dir.file("state.json").string();
  return cfg;
}

auto days_ago(int n) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now() - std::chrono::days(n);
}

// Lets cancelled timer coroutines finish before the application goes away.
auto drain(Application &app) -> void {
  app.io().restart();
  app.io().run_for(1s);
  app.io().restart();
}

} // namespace

TEST(ApplicationTest, AccessorsRequireInit) {
  Application app(memory_config());
  EXPECT_THROW((void)app.store(), std::system_error);
  EXPECT_THROW((void)app.engine(), std::system_error);
  EXPECT_THROW((void)app.scheduler(), std::system_error);
  EXPECT_FALSE(app.is_running());

  auto started = app.start();
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error(), make_error_code(Error::InvalidState));

  auto saved = app.save_content(test::make_content("early", days_ago(1)));
  ASSERT_FALSE(saved.has_value());
  EXPECT_EQ(saved.error(), make_error_code(Error::InvalidState));
}

TEST(ApplicationTest, InitBuildsComponentsFromConfig) {
  auto cfg = memory_config();
  cfg.engine.fans_feedback_days = 5;
  cfg.scheduler.marker_key = "custom_marker";
  Application app(cfg);
  ASSERT_TRUE(app.init().has_value());
  ASSERT_TRUE(app.init().has_value());

  ASSERT_EQ(app.engine().rules().size(), 2U);
  EXPECT_EQ(app.engine().rules()[0].threshold, std::chrono::days(5));
  EXPECT_EQ(app.scheduler().config().marker_key, "custom_marker");
  EXPECT_FALSE(app.offline_queue().is_syncing());
}

TEST(ApplicationTest, ComponentsOwnSeparateRetryExecutors) {
  auto cfg = memory_config();
  cfg.retry.max_attempts = 4;
  Application app(cfg);
  ASSERT_TRUE(app.init().has_value());

  EXPECT_NE(&app.engine_retry(), &app.queue_retry());
  EXPECT_NE(&app.engine_retry(), &app.gateway_retry());
  EXPECT_NE(&app.queue_retry(), &app.gateway_retry());
  EXPECT_EQ(app.engine_retry().config().max_attempts, 4);
  EXPECT_EQ(app.queue_retry().config().max_attempts, 4);
  EXPECT_EQ(app.gateway_retry().config().max_attempts, 4);

  ASSERT_TRUE(
      app.save_content(test::make_content("Solo", days_ago(3))).has_value());
  auto report = app.block_on(app.scheduler().force_run());
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_EQ(app.engine_retry().attempt_count(), 1);
  EXPECT_EQ(app.queue_retry().attempt_count(), 0);
  EXPECT_EQ(app.gateway_retry().attempt_count(), 0);
}

TEST(ApplicationTest, ForceRunCreatesDueTasks) {
  Application app(memory_config());
  ASSERT_TRUE(app.init().has_value());
  ASSERT_TRUE(
      app.save_content(test::make_content("Rust async", days_ago(3))).has_value());
  ASSERT_TRUE(
      app.save_content(test::make_content("Old post", days_ago(11))).has_value());

  auto report = app.block_on(app.scheduler().force_run());
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_TRUE(report->ran);
  EXPECT_EQ(report->evaluation.failures, 0U);
  EXPECT_EQ(report->evaluation.created[RuleKind::FansFeedback].size(), 2U);
  EXPECT_EQ(report->evaluation.created[RuleKind::OverallFeedback].size(), 1U);
  EXPECT_EQ(app.store().tasks().size(), 3U);

  auto status = app.scheduler().status();
  ASSERT_TRUE(status.last_run_date.has_value());
  EXPECT_EQ(*status.last_run_date,
            util::local_date_string(std::chrono::system_clock::now()));

  auto again = app.block_on(app.scheduler().check_and_run());
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(again->ran);
  EXPECT_EQ(app.store().tasks().size(), 3U);
}

TEST(ApplicationTest, FileBackendPersistsAcrossRestarts) {
  test::TempDir dir;
  {
    Application app(file_config(dir));
    ASSERT_TRUE(app.init().has_value());
    ASSERT_TRUE(app.save_content(test::make_content("Persisted", days_ago(4)))
                    .has_value());
    auto report = app.block_on(app.scheduler().force_run());
    ASSERT_TRUE(report.has_value()) << report.error().message();
    EXPECT_EQ(report->evaluation.total_created(), 1U);
  }

  Application reopened(file_config(dir));
  ASSERT_TRUE(reopened.init().has_value());
  ASSERT_EQ(reopened.store().contents().size(), 1U);
  ASSERT_EQ(reopened.store().tasks().size(), 1U);
  EXPECT_EQ(reopened.store().tasks()[0].title,
            "Analyse Fans Feedback on Persisted");
  EXPECT_TRUE(reopened.scheduler().status().last_run_date.has_value());

  auto again = reopened.block_on(reopened.scheduler().check_and_run());
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(again->ran);
}

TEST(ApplicationTest, FileBackendRejectsCorruptStore) {
  test::TempDir dir;
  ASSERT_TRUE(
      util::write_file_atomic(dir.file("data.json"), "{ not json").has_value());
  Application app(file_config(dir));
  auto r = app.init();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(ApplicationTest, StartAndStop) {
  Application app(memory_config());
  ASSERT_TRUE(app.init().has_value());
  ASSERT_TRUE(app.start().has_value());
  EXPECT_TRUE(app.is_running());
  EXPECT_TRUE(app.scheduler().status().next_run_time.has_value());
  ASSERT_TRUE(app.start().has_value());

  app.stop();
  EXPECT_FALSE(app.is_running());
  drain(app);
}

TEST(ApplicationTest, StartupCheckRunsWhenEnabled) {
  auto cfg = memory_config();
  cfg.scheduler.check_on_start = true;
  Application app(cfg);
  ASSERT_TRUE(app.init().has_value());
  ASSERT_TRUE(
      app.save_content(test::make_content("Fresh", days_ago(3))).has_value());

  ASSERT_TRUE(app.start().has_value());
  app.io().run_for(200ms);
  EXPECT_EQ(app.store().tasks().size(), 1U);

  app.stop();
  drain(app);
  EXPECT_FALSE(app.is_running());
}
