#pragma once

#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/model/content.hpp"
#include "contentflow/model/task.hpp"
#include "contentflow/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace contentflow {

// Collaborator interfaces consumed by the engine. The core is transport
// agnostic: implementations may talk to a remote service, a file or memory.
// All methods are coroutines returning task<Result<T>>; callers co_await them
// directly.

class ContentRepository {
public:
  virtual ~ContentRepository() = default;

  // Content in the terminal (Published) stage.
  virtual auto list_published_content()
      -> task<Result<std::vector<Content>>> = 0;
  virtual auto find_content(ContentId id)
      -> task<Result<std::optional<Content>>> = 0;
  virtual auto find_content_by_topic(std::string topic)
      -> task<Result<std::optional<Content>>> = 0;
  // Appends a flag; adding a flag that is already present is not an error.
  virtual auto add_content_flag(ContentId id, ContentFlag flag)
      -> task<Result<Content>> = 0;
};

class TaskRepository {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~TaskRepository() = default;

  virtual auto list_tasks(TaskType type) -> task<Result<std::vector<Task>>> = 0;
  virtual auto find_task(TaskId id) -> task<Result<std::optional<Task>>> = 0;
  virtual auto create_task(TaskDraft draft) -> task<Result<Task>> = 0;
  // Removing an unknown id yields Error::NotFound.
  virtual auto remove_task(TaskId id) -> task<Result<void>> = 0;
  virtual auto remove_expired_tasks(TimePoint now)
      -> task<Result<std::size_t>> = 0;
};

// Small synchronous key/value store for scheduler bookkeeping. Assumes a
// single active writer; there is no lease or compare-and-swap.
class MarkerStore {
public:
  virtual ~MarkerStore() = default;

  [[nodiscard]] virtual auto get(std::string_view key)
      -> Result<std::optional<std::string>> = 0;
  [[nodiscard]] virtual auto set(std::string_view key, std::string value)
      -> Result<void> = 0;
};

} // namespace contentflow
