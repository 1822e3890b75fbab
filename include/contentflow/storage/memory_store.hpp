#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/storage/repository.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace contentflow {

// In-process Content/Task store. Insertion order is preserved for listings.
// Methods are virtual so tests can inject failures in front of them.
class MemoryStore : public ContentRepository, public TaskRepository {
public:
  using Clock = std::function<TimePoint()>;

  explicit MemoryStore(std::chrono::days task_ttl = rules::kTaskTimeToLive,
                       Clock clock = {});
  ~MemoryStore() override = default;

  MemoryStore(const MemoryStore &) = delete;
  auto operator=(const MemoryStore &) -> MemoryStore & = delete;

  // ContentRepository
  auto list_published_content() -> task<Result<std::vector<Content>>> override;
  auto find_content(ContentId id)
      -> task<Result<std::optional<Content>>> override;
  auto find_content_by_topic(std::string topic)
      -> task<Result<std::optional<Content>>> override;
  auto add_content_flag(ContentId id, ContentFlag flag)
      -> task<Result<Content>> override;

  // TaskRepository
  auto list_tasks(TaskType type) -> task<Result<std::vector<Task>>> override;
  auto find_task(TaskId id) -> task<Result<std::optional<Task>>> override;
  auto create_task(TaskDraft draft) -> task<Result<Task>> override;
  auto remove_task(TaskId id) -> task<Result<void>> override;
  auto remove_expired_tasks(TimePoint now)
      -> task<Result<std::size_t>> override;

  // Direct (non-coroutine) access for seeding and inspection.
  [[nodiscard]] auto upsert_content(Content content) -> Result<void>;
  auto insert_task(Task task) -> void;
  auto erase_task(const TaskId &id) -> bool;
  [[nodiscard]] auto contents() const -> std::vector<Content>;
  [[nodiscard]] auto tasks() const -> std::vector<Task>;
  [[nodiscard]] auto content_by_topic(std::string_view topic) const
      -> std::optional<Content>;

protected:
  [[nodiscard]] auto now() const -> TimePoint;
  [[nodiscard]] auto build_task(TaskDraft draft) const -> Task;

  std::vector<Content> contents_;
  std::vector<Task> tasks_;

private:
  std::chrono::days task_ttl_;
  Clock clock_;
};

} // namespace contentflow
