#pragma once

#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/core/fault.hpp"
#include "contentflow/model/content.hpp"
#include "contentflow/resilience/error_reporter.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/storage/memory_store.hpp"
#include "contentflow/util/id.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace contentflow::test {

using TimePoint = std::chrono::system_clock::time_point;

// Run a coroutine synchronously on `io` and return its result. Work the
// coroutine spawns onto `io` is drained as well.
template <typename T>
[[nodiscard]] inline auto
run_on(boost::asio::io_context &io, task<T> coro,
       std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.restart();
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_on timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

inline auto
run_on(boost::asio::io_context &io, task<void> coro,
       std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  std::exception_ptr eptr;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        co_await std::move(coro);
        done = true;
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.restart();
  io.run_for(timeout);
  if (!done && !eptr)
    throw std::runtime_error("run_on timed out");
  if (eptr)
    std::rethrow_exception(eptr);
}

// Run a coroutine synchronously on a fresh io_context and return its result.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  return run_on(io, std::move(coro), timeout);
}

inline auto
run_coro(task<void> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  boost::asio::io_context io;
  run_on(io, std::move(coro), timeout);
}

// Settable wall clock shared with the component under test.
struct ManualClock {
  TimePoint now{std::chrono::sys_days{std::chrono::year{2024} /
                                      std::chrono::January / 15} +
                std::chrono::hours(12)};

  [[nodiscard]] auto fn() -> std::function<TimePoint()> {
    return [this] { return now; };
  }
  auto advance(std::chrono::system_clock::duration d) -> void { now += d; }
};

class RecordingReporter final : public ErrorReporter {
public:
  auto report(const Fault &fault, std::string_view context, ReportMeta meta)
      -> void override {
    reports.push_back(ReportedError{.fault = fault,
                                    .context = std::string(context),
                                    .meta = meta,
                                    .at = std::chrono::system_clock::now()});
  }

  std::vector<ReportedError> reports;
};

// Records requested backoff delays instead of sleeping.
struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> delays;

  [[nodiscard]] auto fn() -> RetryExecutor::Sleeper {
    return [this](std::chrono::milliseconds d) -> task<void> {
      delays.push_back(d);
      co_return;
    };
  }
};

// MemoryStore with scripted failures in front of the repository calls.
class FaultyStore : public MemoryStore {
public:
  using MemoryStore::MemoryStore;

  // Number of upcoming calls that fail with the matching error.
  int fail_list_content{0};
  int fail_list_tasks{0};
  int fail_find_content{0};
  int fail_create{0};
  int fail_flag{0};
  int fail_remove{0};
  int fail_expire{0};
  Error error{Error::NetworkError};
  // Scripted failures throw std::system_error instead of returning it.
  bool throw_errors{false};
  // create_task fails permanently for titles containing this text.
  std::optional<std::string> reject_title;

  int create_calls{0};
  int flag_calls{0};
  int remove_calls{0};
  int list_tasks_calls{0};

  auto list_published_content() -> task<Result<std::vector<Content>>> override {
    if (consume(fail_list_content)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::list_published_content();
  }

  auto find_content(ContentId id)
      -> task<Result<std::optional<Content>>> override {
    if (consume(fail_find_content)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::find_content(std::move(id));
  }

  auto find_content_by_topic(std::string topic)
      -> task<Result<std::optional<Content>>> override {
    if (consume(fail_find_content)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::find_content_by_topic(std::move(topic));
  }

  auto add_content_flag(ContentId id, ContentFlag flag)
      -> task<Result<Content>> override {
    ++flag_calls;
    if (consume(fail_flag)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::add_content_flag(std::move(id), flag);
  }

  auto list_tasks(TaskType type) -> task<Result<std::vector<Task>>> override {
    ++list_tasks_calls;
    if (consume(fail_list_tasks)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::list_tasks(type);
  }

  auto create_task(TaskDraft draft) -> task<Result<Task>> override {
    ++create_calls;
    if (reject_title && draft.title.find(*reject_title) != std::string::npos) {
      co_return fail(Error::ValidationFailed);
    }
    if (consume(fail_create)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::create_task(std::move(draft));
  }

  auto remove_task(TaskId id) -> task<Result<void>> override {
    ++remove_calls;
    if (consume(fail_remove)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::remove_task(std::move(id));
  }

  auto remove_expired_tasks(TimePoint now)
      -> task<Result<std::size_t>> override {
    if (consume(fail_expire)) {
      co_return fail(error);
    }
    co_return co_await MemoryStore::remove_expired_tasks(now);
  }

private:
  auto consume(int &counter) const -> bool {
    if (counter <= 0) {
      return false;
    }
    --counter;
    if (throw_errors) {
      throw std::system_error(make_error_code(error), "repository threw");
    }
    return true;
  }
};

[[nodiscard]] inline auto make_content(std::string topic, TimePoint updated_at,
                                       ContentStage stage =
                                           ContentStage::Published)
    -> Content {
  return Content{.id = generate_content_id(),
                 .topic = std::move(topic),
                 .stage = stage,
                 .updated_at = updated_at};
}

// Retry config with zero delays for fast tests.
[[nodiscard]] inline auto fast_retry_config(int max_attempts = 3)
    -> RetryConfig {
  RetryConfig cfg;
  cfg.max_attempts = max_attempts;
  cfg.base_delay = std::chrono::milliseconds(0);
  cfg.max_delay = std::chrono::milliseconds(0);
  return cfg;
}

// Unique scratch directory removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("contentflow_test_" + std::to_string(rd()) + "_" +
             std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  auto operator=(const TempDir &) -> TempDir & = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }
  [[nodiscard]] auto file(std::string_view name) const
      -> std::filesystem::path {
    return path_ / name;
  }

private:
  std::filesystem::path path_;
};

} // namespace contentflow::test
