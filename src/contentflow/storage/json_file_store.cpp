#include "contentflow/storage/json_file_store.hpp"

#include "contentflow/util/file.hpp"
#include "contentflow/util/log.hpp"
#include "contentflow/util/time.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace contentflow {
namespace detail {

struct ContentJson {
  std::string id;
  std::string topic;
  std::string stage{"pending"};
  std::vector<std::string> flags;
  std::int64_t updated_at{0}; // unix millis
};

struct CorrelationJson {
  std::string content_id;
  std::string rule;
};

struct TaskJson {
  std::string id;
  std::string title;
  std::string description;
  std::string type{"user"};
  std::int64_t created_at{0};
  std::int64_t expires_at{0};
  std::optional<std::string> link;
  std::optional<CorrelationJson> correlation;
};

struct StoreJson {
  std::vector<ContentJson> contents;
  std::vector<TaskJson> tasks;
};

} // namespace detail
} // namespace contentflow

namespace glz {
template <> struct meta<contentflow::detail::ContentJson> {
  using T = contentflow::detail::ContentJson;
  static constexpr auto value =
      object("id", &T::id, "topic", &T::topic, "stage", &T::stage, "flags",
             &T::flags, "updated_at", &T::updated_at);
};

template <> struct meta<contentflow::detail::CorrelationJson> {
  using T = contentflow::detail::CorrelationJson;
  static constexpr auto value =
      object("content_id", &T::content_id, "rule", &T::rule);
};

template <> struct meta<contentflow::detail::TaskJson> {
  using T = contentflow::detail::TaskJson;
  static constexpr auto value = object(
      "id", &T::id, "title", &T::title, "description", &T::description, "type",
      &T::type, "created_at", &T::created_at, "expires_at", &T::expires_at,
      "link", &T::link, "correlation", &T::correlation);
};

template <> struct meta<contentflow::detail::StoreJson> {
  using T = contentflow::detail::StoreJson;
  static constexpr auto value =
      object("contents", &T::contents, "tasks", &T::tasks);
};
} // namespace glz

namespace contentflow {
namespace {

[[nodiscard]] auto to_domain(detail::ContentJson &&raw) -> Result<Content> {
  auto stage = parse<ContentStage>(raw.stage);
  if (!stage) {
    log::error("Unknown content stage '{}' for topic '{}'", raw.stage,
               raw.topic);
    return fail(Error::ParseError);
  }
  Content content;
  content.id = ContentId{std::move(raw.id)};
  content.topic = std::move(raw.topic);
  content.stage = *stage;
  content.updated_at = util::from_unix_millis(raw.updated_at);
  for (const auto &name : raw.flags) {
    auto flag = parse<ContentFlag>(name);
    if (!flag) {
      log::error("Unknown content flag '{}' for topic '{}'", name,
                 content.topic);
      return fail(Error::ParseError);
    }
    content.add_flag(*flag);
  }
  return ok(std::move(content));
}

[[nodiscard]] auto to_domain(detail::TaskJson &&raw) -> Result<Task> {
  auto type = parse<TaskType>(raw.type);
  if (!type || raw.id.empty()) {
    return fail(Error::ParseError);
  }
  Task out;
  out.id = TaskId{std::move(raw.id)};
  out.title = std::move(raw.title);
  out.description = std::move(raw.description);
  out.type = *type;
  out.created_at = util::from_unix_millis(raw.created_at);
  out.expires_at = util::from_unix_millis(raw.expires_at);
  out.link = std::move(raw.link);
  if (raw.correlation) {
    auto rule = parse<RuleKind>(raw.correlation->rule);
    if (!rule) {
      return fail(Error::ParseError);
    }
    out.correlation = TaskCorrelation{
        .content_id = ContentId{std::move(raw.correlation->content_id)},
        .rule = *rule};
  }
  return ok(std::move(out));
}

[[nodiscard]] auto to_json(const Content &content) -> detail::ContentJson {
  detail::ContentJson raw;
  raw.id = content.id.str();
  raw.topic = content.topic;
  raw.stage = std::string(to_string_view(content.stage));
  for (auto flag : content.flags) {
    raw.flags.emplace_back(to_string_view(flag));
  }
  raw.updated_at = util::to_unix_millis(content.updated_at);
  return raw;
}

[[nodiscard]] auto to_json(const Task &t) -> detail::TaskJson {
  detail::TaskJson raw;
  raw.id = t.id.str();
  raw.title = t.title;
  raw.description = t.description;
  raw.type = std::string(to_string_view(t.type));
  raw.created_at = util::to_unix_millis(t.created_at);
  raw.expires_at = util::to_unix_millis(t.expires_at);
  raw.link = t.link;
  if (t.correlation) {
    raw.correlation = detail::CorrelationJson{
        .content_id = t.correlation->content_id.str(),
        .rule = std::string(to_string_view(t.correlation->rule))};
  }
  return raw;
}

} // namespace

JsonFileStore::JsonFileStore(std::filesystem::path path,
                             std::chrono::days task_ttl, Clock clock)
    : MemoryStore(task_ttl, std::move(clock)), path_(std::move(path)) {}

auto JsonFileStore::open(std::filesystem::path path, std::chrono::days task_ttl,
                         Clock clock) -> Result<std::unique_ptr<JsonFileStore>> {
  std::unique_ptr<JsonFileStore> store(
      new JsonFileStore(std::move(path), task_ttl, std::move(clock)));

  auto text = util::read_file(store->path_);
  if (!text) {
    // First run: start empty, the file appears on the first write.
    log::info("Store file {} not found, starting empty",
              store->path_.string());
    return ok(std::move(store));
  }
  if (auto r = store->load(*text); !r) {
    return fail(r.error());
  }
  log::info("Loaded {} content item(s) and {} task(s) from {}",
            store->contents_.size(), store->tasks_.size(),
            store->path_.string());
  return ok(std::move(store));
}

auto JsonFileStore::load(std::string_view text) -> Result<void> {
  detail::StoreJson raw{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("Store file {} is not valid JSON: {}", path_.string(),
               glz::format_error(ec, text));
    return fail(Error::ParseError);
  }

  std::vector<Content> contents;
  contents.reserve(raw.contents.size());
  for (auto &c : raw.contents) {
    auto content = to_domain(std::move(c));
    if (!content) {
      return fail(content.error());
    }
    contents.push_back(std::move(*content));
  }

  std::vector<Task> loaded_tasks;
  loaded_tasks.reserve(raw.tasks.size());
  for (auto &t : raw.tasks) {
    auto parsed = to_domain(std::move(t));
    if (!parsed) {
      return fail(parsed.error());
    }
    loaded_tasks.push_back(std::move(*parsed));
  }

  contents_ = std::move(contents);
  tasks_ = std::move(loaded_tasks);
  return ok();
}

auto JsonFileStore::serialize(const std::vector<Content> &contents,
                              const std::vector<Task> &tasks)
    -> Result<std::string> {
  detail::StoreJson raw;
  for (const auto &c : contents) {
    raw.contents.push_back(to_json(c));
  }
  for (const auto &t : tasks) {
    raw.tasks.push_back(to_json(t));
  }
  auto out = glz::write<glz::opts{.prettify = true}>(raw);
  if (!out) {
    return fail(Error::StorageError);
  }
  return ok(std::move(*out));
}

auto JsonFileStore::flush() -> Result<void> {
  return serialize(contents_, tasks_).and_then([this](const std::string &doc) {
    return util::write_file_atomic(path_, doc);
  });
}

auto JsonFileStore::save_content(Content content) -> Result<void> {
  auto previous = contents_;
  if (auto r = upsert_content(std::move(content)); !r) {
    return r;
  }
  if (auto r = flush(); !r) {
    contents_ = std::move(previous);
    log::error("Failed to persist store {}: {}", path_.string(),
               r.error().message());
    return fail(Error::StorageError);
  }
  return ok();
}

auto JsonFileStore::add_content_flag(ContentId id, ContentFlag flag)
    -> task<Result<Content>> {
  auto previous = contents_;
  auto res = co_await MemoryStore::add_content_flag(std::move(id), flag);
  if (!res) {
    co_return res;
  }
  if (auto r = flush(); !r) {
    contents_ = std::move(previous);
    log::error("Failed to persist store {}: {}", path_.string(),
               r.error().message());
    co_return fail(Error::StorageError);
  }
  co_return res;
}

auto JsonFileStore::create_task(TaskDraft draft) -> task<Result<Task>> {
  auto res = co_await MemoryStore::create_task(std::move(draft));
  if (!res) {
    co_return res;
  }
  if (auto r = flush(); !r) {
    log::error("Failed to persist store {}: {}", path_.string(),
               r.error().message());
    erase_task(res->id);
    co_return fail(Error::StorageError);
  }
  co_return res;
}

auto JsonFileStore::remove_task(TaskId id) -> task<Result<void>> {
  auto previous = tasks_;
  auto res = co_await MemoryStore::remove_task(std::move(id));
  if (!res) {
    co_return res;
  }
  if (auto r = flush(); !r) {
    tasks_ = std::move(previous);
    log::error("Failed to persist store {}: {}", path_.string(),
               r.error().message());
    co_return fail(Error::StorageError);
  }
  co_return ok();
}

auto JsonFileStore::remove_expired_tasks(TimePoint now)
    -> task<Result<std::size_t>> {
  auto previous = tasks_;
  auto res = co_await MemoryStore::remove_expired_tasks(now);
  if (!res || *res == 0) {
    co_return res;
  }
  if (auto r = flush(); !r) {
    tasks_ = std::move(previous);
    log::error("Failed to persist store {}: {}", path_.string(),
               r.error().message());
    co_return fail(Error::StorageError);
  }
  co_return res;
}

} // namespace contentflow
