#include "contentflow/storage/memory_store.hpp"

#include "contentflow/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace contentflow {

MemoryStore::MemoryStore(std::chrono::days task_ttl, Clock clock)
    : task_ttl_(task_ttl), clock_(std::move(clock)) {}

auto MemoryStore::now() const -> TimePoint {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

auto MemoryStore::build_task(TaskDraft draft) const -> Task {
  const auto created = now();
  Task task;
  task.id = generate_task_id();
  task.title = std::move(draft.title);
  task.description = std::move(draft.description);
  task.type = draft.type;
  task.created_at = created;
  task.expires_at = draft.expires_at.value_or(created + task_ttl_);
  task.link = std::move(draft.link);
  task.correlation = std::move(draft.correlation);
  return task;
}

auto MemoryStore::list_published_content()
    -> task<Result<std::vector<Content>>> {
  std::vector<Content> out;
  std::ranges::copy_if(contents_, std::back_inserter(out),
                       [](const Content &c) { return is_terminal(c.stage); });
  co_return ok(std::move(out));
}

auto MemoryStore::find_content(ContentId id)
    -> task<Result<std::optional<Content>>> {
  auto it = std::ranges::find(contents_, id, &Content::id);
  if (it == contents_.end()) {
    co_return ok(std::optional<Content>{});
  }
  co_return ok(std::optional<Content>{*it});
}

auto MemoryStore::find_content_by_topic(std::string topic)
    -> task<Result<std::optional<Content>>> {
  co_return ok(content_by_topic(topic));
}

auto MemoryStore::add_content_flag(ContentId id, ContentFlag flag)
    -> task<Result<Content>> {
  auto it = std::ranges::find(contents_, id, &Content::id);
  if (it == contents_.end()) {
    co_return fail(Error::NotFound);
  }
  // updated_at is left alone: it dates the publication the rules measure from.
  it->add_flag(flag);
  co_return ok(*it);
}

auto MemoryStore::list_tasks(TaskType type) -> task<Result<std::vector<Task>>> {
  std::vector<Task> out;
  std::ranges::copy_if(tasks_, std::back_inserter(out),
                       [type](const Task &t) { return t.type == type; });
  co_return ok(std::move(out));
}

auto MemoryStore::find_task(TaskId id) -> task<Result<std::optional<Task>>> {
  auto it = std::ranges::find(tasks_, id, &Task::id);
  if (it == tasks_.end()) {
    co_return ok(std::optional<Task>{});
  }
  co_return ok(std::optional<Task>{*it});
}

auto MemoryStore::create_task(TaskDraft draft) -> task<Result<Task>> {
  if (draft.title.empty()) {
    co_return fail(Error::ValidationFailed);
  }
  auto created = build_task(std::move(draft));
  tasks_.push_back(created);
  log::debug("Task created: {} ({})", created.title, created.id);
  co_return ok(std::move(created));
}

auto MemoryStore::remove_task(TaskId id) -> task<Result<void>> {
  if (!erase_task(id)) {
    co_return fail(Error::NotFound);
  }
  co_return ok();
}

auto MemoryStore::remove_expired_tasks(TimePoint now)
    -> task<Result<std::size_t>> {
  const auto removed = std::erase_if(
      tasks_, [now](const Task &t) { return t.is_expired(now); });
  co_return ok(static_cast<std::size_t>(removed));
}

auto MemoryStore::upsert_content(Content content) -> Result<void> {
  if (content.topic.empty()) {
    return fail(Error::ValidationFailed);
  }
  if (content.id.empty()) {
    content.id = generate_content_id();
  }
  auto same_topic = std::ranges::find(contents_, content.topic, &Content::topic);
  if (same_topic != contents_.end() && same_topic->id != content.id) {
    return fail(Error::AlreadyExists);
  }

  auto it = std::ranges::find(contents_, content.id, &Content::id);
  if (it == contents_.end()) {
    contents_.push_back(std::move(content));
    return ok();
  }
  if (content.stage < it->stage) {
    // Stages only move forward.
    return fail(Error::InvalidState);
  }
  for (auto flag : it->flags) {
    content.add_flag(flag);
  }
  *it = std::move(content);
  return ok();
}

auto MemoryStore::insert_task(Task task) -> void {
  if (task.id.empty()) {
    task.id = generate_task_id();
  }
  tasks_.push_back(std::move(task));
}

auto MemoryStore::erase_task(const TaskId &id) -> bool {
  return std::erase_if(tasks_, [&id](const Task &t) { return t.id == id; }) >
         0;
}

auto MemoryStore::contents() const -> std::vector<Content> {
  return contents_;
}

auto MemoryStore::tasks() const -> std::vector<Task> { return tasks_; }

auto MemoryStore::content_by_topic(std::string_view topic) const
    -> std::optional<Content> {
  auto it = std::ranges::find(contents_, topic, &Content::topic);
  if (it == contents_.end()) {
    return std::nullopt;
  }
  return *it;
}

} // namespace contentflow
