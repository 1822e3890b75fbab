#include "contentflow/storage/marker_store.hpp"
#include "contentflow/util/file.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace contentflow;
using contentflow::test::TempDir;

TEST(MemoryMarkerStoreTest, GetSet) {
  MemoryMarkerStore store;
  auto empty = store.get("last_task_check");
  ASSERT_TRUE(empty.has_value());
  EXPECT_FALSE(empty->has_value());

  ASSERT_TRUE(store.set("last_task_check", "Mon Jan 15 2024"));
  ASSERT_TRUE(store.set("last_task_check", "Tue Jan 16 2024"));
  auto value = store.get("last_task_check");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "Tue Jan 16 2024");
}

TEST(FileMarkerStoreTest, PersistsAcrossReopen) {
  TempDir dir;
  const auto path = dir.file("state.json");
  {
    auto store = FileMarkerStore::open(path);
    ASSERT_TRUE(store.has_value());
    ASSERT_TRUE((*store)->set("last_task_check", "Mon Jan 15 2024"));
    ASSERT_TRUE((*store)->set("other", "x"));
  }
  auto reopened = FileMarkerStore::open(path);
  ASSERT_TRUE(reopened.has_value());
  auto value = (*reopened)->get("last_task_check");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "Mon Jan 15 2024");
  EXPECT_EQ(*(*reopened)->get("other"), "x");
}

TEST(FileMarkerStoreTest, FailedWriteKeepsPreviousValue) {
  TempDir dir;
  auto store = FileMarkerStore::open(dir.path() / "missing" / "state.json");
  ASSERT_TRUE(store.has_value());
  EXPECT_FALSE((*store)->set("last_task_check", "Mon Jan 15 2024"));
  auto value = (*store)->get("last_task_check");
  ASSERT_TRUE(value.has_value());
  EXPECT_FALSE(value->has_value());
}

TEST(FileMarkerStoreTest, RejectsCorruptFile) {
  TempDir dir;
  ASSERT_TRUE(util::write_file_atomic(dir.file("state.json"), "[1, 2"));
  auto store = FileMarkerStore::open(dir.file("state.json"));
  ASSERT_FALSE(store.has_value());
  EXPECT_EQ(store.error(), make_error_code(Error::ParseError));
}
