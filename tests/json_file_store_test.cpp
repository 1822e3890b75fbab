#include "contentflow/storage/json_file_store.hpp"
#include "contentflow/util/file.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <filesystem>

using namespace contentflow;
using namespace std::chrono_literals;
using contentflow::test::make_content;
using contentflow::test::ManualClock;
using contentflow::test::run_coro;
using contentflow::test::TempDir;

namespace {

class JsonFileStoreTest : public ::testing::Test {
protected:
  auto open() -> std::unique_ptr<JsonFileStore> {
    auto store =
        JsonFileStore::open(dir_.file("data.json"), std::chrono::days(7),
                            clock_.fn());
    EXPECT_TRUE(store.has_value());
    return store ? std::move(*store) : nullptr;
  }

  TempDir dir_;
  ManualClock clock_;
};

} // namespace

TEST_F(JsonFileStoreTest, MissingFileStartsEmpty) {
  auto store = open();
  ASSERT_NE(store, nullptr);
  EXPECT_TRUE(store->contents().empty());
  EXPECT_TRUE(store->tasks().empty());
  EXPECT_FALSE(std::filesystem::exists(dir_.file("data.json")));
}

TEST_F(JsonFileStoreTest, MutationsSurviveReopen) {
  TaskId task_id;
  ContentId content_id;
  {
    auto store = open();
    ASSERT_NE(store, nullptr);
    auto item = make_content("Async Rust", clock_.now - std::chrono::days(3));
    content_id = item.id;
    ASSERT_TRUE(store->save_content(item));
    ASSERT_TRUE(run_coro(store->add_content_flag(
                             item.id, ContentFlag::FansFeedbackAnalysed))
                    .has_value());
    auto created = run_coro(store->create_task(TaskDraft{
        .title = "Analyse Overall Feedback on Async Rust",
        .description = "review",
        .type = TaskType::System,
        .link = "/content/edit/x",
        .correlation = TaskCorrelation{.content_id = item.id,
                                       .rule = RuleKind::OverallFeedback}}));
    ASSERT_TRUE(created.has_value());
    task_id = created->id;
  }

  auto reopened = open();
  ASSERT_NE(reopened, nullptr);
  auto content = reopened->content_by_topic("Async Rust");
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(content->id, content_id);
  EXPECT_EQ(content->stage, ContentStage::Published);
  EXPECT_TRUE(content->has_flag(ContentFlag::FansFeedbackAnalysed));
  EXPECT_EQ(content->updated_at,
            std::chrono::floor<std::chrono::milliseconds>(
                clock_.now - std::chrono::days(3)));

  auto tasks = reopened->tasks();
  ASSERT_EQ(tasks.size(), 1U);
  EXPECT_EQ(tasks[0].id, task_id);
  EXPECT_EQ(tasks[0].type, TaskType::System);
  EXPECT_EQ(tasks[0].link, "/content/edit/x");
  ASSERT_TRUE(tasks[0].correlation.has_value());
  EXPECT_EQ(tasks[0].correlation->content_id, content_id);
  EXPECT_EQ(tasks[0].correlation->rule, RuleKind::OverallFeedback);
  EXPECT_EQ(tasks[0].expires_at, clock_.now + std::chrono::days(7));
}

TEST_F(JsonFileStoreTest, RemovalsArePersisted) {
  {
    auto store = open();
    ASSERT_NE(store, nullptr);
    auto keep = run_coro(store->create_task(TaskDraft{.title = "keep"}));
    auto expire = run_coro(store->create_task(
        TaskDraft{.title = "expire", .expires_at = clock_.now + 1h}));
    auto drop = run_coro(store->create_task(TaskDraft{.title = "drop"}));
    ASSERT_TRUE(keep && expire && drop);

    ASSERT_TRUE(run_coro(store->remove_task(drop->id)).has_value());
    auto removed = run_coro(store->remove_expired_tasks(clock_.now + 2h));
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1U);
  }

  auto reopened = open();
  ASSERT_NE(reopened, nullptr);
  ASSERT_EQ(reopened->tasks().size(), 1U);
  EXPECT_EQ(reopened->tasks().front().title, "keep");
}

TEST_F(JsonFileStoreTest, DocumentUsesSnakeCaseEnums) {
  auto item = make_content("Topic", clock_.now, ContentStage::SeoOptimised);
  item.add_flag(ContentFlag::OverallFeedbackAnalysed);
  auto doc = JsonFileStore::serialize({item}, {});
  ASSERT_TRUE(doc.has_value());
  EXPECT_NE(doc->find("\"seo_optimised\""), std::string::npos);
  EXPECT_NE(doc->find("\"overall_feedback_analysed\""), std::string::npos);
  EXPECT_NE(doc->find("\"contents\""), std::string::npos);
  EXPECT_NE(doc->find("\"tasks\""), std::string::npos);
}

TEST_F(JsonFileStoreTest, CorruptFileIsRejected) {
  ASSERT_TRUE(util::write_file_atomic(dir_.file("data.json"), "{ not json"));
  auto store = JsonFileStore::open(dir_.file("data.json"));
  ASSERT_FALSE(store.has_value());
  EXPECT_EQ(store.error(), make_error_code(Error::ParseError));
}

TEST_F(JsonFileStoreTest, UnknownStageIsRejected) {
  ASSERT_TRUE(util::write_file_atomic(
      dir_.file("data.json"),
      R"({"contents":[{"id":"c1","topic":"t","stage":"mastered","flags":[],"updated_at":0}],"tasks":[]})"));
  auto store = JsonFileStore::open(dir_.file("data.json"));
  ASSERT_FALSE(store.has_value());
  EXPECT_EQ(store.error(), make_error_code(Error::ParseError));
}

TEST_F(JsonFileStoreTest, FailedFlushRollsBackCreate) {
  auto store = JsonFileStore::open(dir_.path() / "missing" / "data.json");
  ASSERT_TRUE(store.has_value());
  auto created = run_coro((*store)->create_task(TaskDraft{.title = "x"}));
  ASSERT_FALSE(created.has_value());
  EXPECT_EQ(created.error(), make_error_code(Error::StorageError));
  EXPECT_TRUE((*store)->tasks().empty());
}

TEST_F(JsonFileStoreTest, FailedFlushRollsBackFlagAndRemovals) {
  auto store = open();
  ASSERT_NE(store, nullptr);
  auto item = make_content("C", clock_.now - std::chrono::days(3));
  ASSERT_TRUE(store->save_content(item).has_value());
  auto created = run_coro(store->create_task(TaskDraft{.title = "t1"}));
  ASSERT_TRUE(created.has_value());

  // A directory in place of the temp file makes every flush fail.
  std::filesystem::create_directories(dir_.file("data.json.tmp"));

  auto flagged = run_coro(
      store->add_content_flag(item.id, ContentFlag::FansFeedbackAnalysed));
  ASSERT_FALSE(flagged.has_value());
  EXPECT_EQ(flagged.error(), make_error_code(Error::StorageError));
  ASSERT_EQ(store->contents().size(), 1U);
  EXPECT_FALSE(
      store->contents()[0].has_flag(ContentFlag::FansFeedbackAnalysed));

  auto removed = run_coro(store->remove_task(created->id));
  ASSERT_FALSE(removed.has_value());
  EXPECT_EQ(removed.error(), make_error_code(Error::StorageError));
  ASSERT_EQ(store->tasks().size(), 1U);
  EXPECT_EQ(store->tasks()[0].id, created->id);

  clock_.advance(std::chrono::days(8));
  auto swept = run_coro(store->remove_expired_tasks(clock_.now));
  ASSERT_FALSE(swept.has_value());
  EXPECT_EQ(store->tasks().size(), 1U);

  std::filesystem::remove_all(dir_.file("data.json.tmp"));
  auto reopened = open();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->tasks().size(), 1U);
  EXPECT_FALSE(
      reopened->contents()[0].has_flag(ContentFlag::FansFeedbackAnalysed));
}
