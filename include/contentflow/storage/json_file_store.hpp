#pragma once

#include "contentflow/storage/memory_store.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace contentflow {

// MemoryStore persisted to a single JSON document:
//   { "contents": [...], "tasks": [...] }
// Every successful mutation rewrites the file.
class JsonFileStore final : public MemoryStore {
public:
  [[nodiscard]] static auto open(std::filesystem::path path,
                                 std::chrono::days task_ttl =
                                     rules::kTaskTimeToLive,
                                 Clock clock = {})
      -> Result<std::unique_ptr<JsonFileStore>>;

  auto add_content_flag(ContentId id, ContentFlag flag)
      -> task<Result<Content>> override;
  auto create_task(TaskDraft draft) -> task<Result<Task>> override;
  auto remove_task(TaskId id) -> task<Result<void>> override;
  auto remove_expired_tasks(TimePoint now)
      -> task<Result<std::size_t>> override;

  // upsert_content followed by a flush.
  [[nodiscard]] auto save_content(Content content) -> Result<void>;

  [[nodiscard]] auto flush() -> Result<void>;
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path & {
    return path_;
  }

  // Exposed for tests and tooling.
  [[nodiscard]] static auto serialize(const std::vector<Content> &contents,
                                      const std::vector<Task> &tasks)
      -> Result<std::string>;

private:
  JsonFileStore(std::filesystem::path path, std::chrono::days task_ttl,
                Clock clock);

  [[nodiscard]] auto load(std::string_view text) -> Result<void>;

  std::filesystem::path path_;
};

} // namespace contentflow
