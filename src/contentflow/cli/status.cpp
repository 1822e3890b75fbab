#include "contentflow/cli/command_support.hpp"
#include "contentflow/cli/commands.hpp"
#include "contentflow/cli/formatting.hpp"
#include "contentflow/util/json.hpp"
#include "contentflow/util/time.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <print>
#include <string>

namespace contentflow::cli {

auto cmd_status(const StatusOptions &opts) -> int {
  auto app = detail::open_application(opts.config_file, std::nullopt);
  if (!app) {
    return 1;
  }

  const auto now = std::chrono::system_clock::now();
  const auto status = app->scheduler().status();
  const auto today = util::local_date_string(now);
  const bool ran_today = status.last_run_date == today;
  const auto next_boundary =
      status.next_run_time.value_or(util::next_local_midnight(now));

  auto &store = app->store();
  const auto contents = store.contents();
  const auto tasks = store.tasks();
  const auto published = std::ranges::count_if(
      contents, [](const Content &c) { return is_terminal(c.stage); });
  const auto system_tasks = std::ranges::count_if(
      tasks, [](const Task &t) { return t.type == TaskType::System; });
  const auto &cfg = app->config();

  if (opts.json) {
    JsonValue obj{
        {"running", status.is_running},
        {"today", today},
        {"ran_today", ran_today},
        {"next_boundary", util::format_iso8601(next_boundary)},
        {"backend", std::string(to_string_view(cfg.store.backend))},
        {"content_count", static_cast<std::int64_t>(contents.size())},
        {"published_count", static_cast<std::int64_t>(published)},
        {"task_count", static_cast<std::int64_t>(tasks.size())},
        {"system_task_count", static_cast<std::int64_t>(system_tasks)},
    };
    if (status.last_run_date) {
      obj["last_run_date"] = *status.last_run_date;
    }
    std::println("{}", dump_json(obj));
    return 0;
  }

  std::println("Scheduler:     {}", fmt::colorize_running(status.is_running));
  std::println("Last run:      {}{}", status.last_run_date.value_or("never"),
               ran_today ? fmt::ansi::green(" (today)") : std::string{});
  std::println("Next boundary: {}", fmt::format_timestamp(next_boundary));
  std::println("Store:         {} ({})", to_string_view(cfg.store.backend),
               cfg.store.backend == StoreBackend::File ? cfg.store.data_file
                                                       : "in-memory");
  std::println("Content:       {} ({} published)", contents.size(), published);
  std::println("Tasks:         {} ({} system)", tasks.size(), system_tasks);
  std::println("Thresholds:    fans {}d, overall {}d, ttl {}d",
               cfg.engine.fans_feedback_days, cfg.engine.overall_feedback_days,
               cfg.engine.task_ttl_days);
  return 0;
}

} // namespace contentflow::cli
