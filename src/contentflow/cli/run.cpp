#include "contentflow/cli/command_support.hpp"
#include "contentflow/cli/commands.hpp"
#include "contentflow/cli/formatting.hpp"
#include "contentflow/util/json.hpp"

#include <cstdint>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace contentflow::cli {

auto cmd_run_now(const RunNowOptions &opts) -> int {
  auto app = detail::open_application(opts.config_file, opts.log_level);
  if (!app) {
    return 1;
  }

  auto report = app->block_on(app->scheduler().force_run());
  if (!report) {
    std::println(stderr, "Error: Daily run failed: {}",
                 report.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue created = JsonValue::object_t{};
    for (const auto &[kind, tasks] : report->evaluation.created) {
      JsonValue arr = std::vector<JsonValue>{};
      for (const auto &t : tasks) {
        arr.get_array().emplace_back(detail::task_to_json(t));
      }
      created[std::string(to_string_view(kind))] = std::move(arr);
    }
    std::println("{}", dump_json(JsonValue{
                           {"date", report->date},
                           {"created", std::move(created)},
                           {"failures", static_cast<std::int64_t>(
                                            report->evaluation.failures)},
                           {"expired_removed", static_cast<std::int64_t>(
                                                   report->expired_removed)},
                       }));
    return 0;
  }

  const auto failures = std::format("{} failure(s)", report->evaluation.failures);
  std::println("Daily run for {}: {} task(s) created, {}, {} "
               "expired task(s) removed",
               fmt::ansi::bold(report->date),
               report->evaluation.total_created(),
               report->evaluation.failures == 0 ? failures
                                                : fmt::ansi::red(failures),
               report->expired_removed);
  for (const auto &[kind, tasks] : report->evaluation.created) {
    for (const auto &t : tasks) {
      std::println("  {} {}", fmt::colorize_rule(kind), t.title);
    }
  }
  return report->evaluation.failures == 0 ? 0 : 2;
}

auto cmd_complete(const CompleteOptions &opts) -> int {
  auto app = detail::open_application(opts.config_file, opts.log_level);
  if (!app) {
    return 1;
  }

  auto done =
      app->block_on(app->engine().complete_derived_task(TaskId{opts.task_id}));
  if (!done) {
    if (done.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: Task '{}' not found", opts.task_id);
    } else {
      std::println(stderr, "Error: Failed to complete task '{}': {}",
                   opts.task_id, done.error().message());
    }
    return 1;
  }

  if (opts.json) {
    JsonValue obj{
        {"task", detail::task_to_json(done->task)},
    };
    if (done->rule) {
      obj["rule"] = std::string(to_string_view(*done->rule));
    }
    if (done->content) {
      obj["content"] = detail::content_to_json(*done->content);
    }
    std::println("{}", dump_json(obj));
    return 0;
  }

  std::println("Completed task '{}'", done->task.title);
  if (done->content && done->rule) {
    std::println("  {} flagged on '{}'", fmt::colorize_rule(*done->rule),
                 done->content->topic);
  }
  return 0;
}

} // namespace contentflow::cli
