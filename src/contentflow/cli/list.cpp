#include "contentflow/cli/command_support.hpp"
#include "contentflow/cli/commands.hpp"
#include "contentflow/cli/formatting.hpp"
#include "contentflow/util/json.hpp"

#include <chrono>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace contentflow::cli {

auto cmd_pending(const PendingOptions &opts) -> int {
  auto app = detail::open_application(opts.config_file, std::nullopt);
  if (!app) {
    return 1;
  }

  auto grouped = app->block_on(app->engine().query_pending_tasks());
  if (!grouped) {
    std::println(stderr, "Error: {}", grouped.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue out = JsonValue::object_t{};
    for (const auto &[kind, tasks] : *grouped) {
      JsonValue arr = std::vector<JsonValue>{};
      for (const auto &t : tasks) {
        arr.get_array().emplace_back(detail::task_to_json(t));
      }
      out[std::string(to_string_view(kind))] = std::move(arr);
    }
    std::println("{}", dump_json(out));
    return 0;
  }

  std::size_t total = 0;
  for (const auto &[kind, tasks] : *grouped) {
    total += tasks.size();
  }
  if (total == 0) {
    std::println("No pending system tasks.");
    return 0;
  }

  const auto now = std::chrono::system_clock::now();
  fmt::Table table({{.header = "TASK_ID", .width = 36},
                    {.header = "RULE", .width = 16},
                    {.header = "TITLE", .width = 48},
                    {.header = "AGE", .width = 5, .right_align = true},
                    {.header = "EXPIRES", .width = 19}});
  table.print_header();
  for (const auto &[kind, tasks] : *grouped) {
    for (const auto &t : tasks) {
      table.print_row({t.id.str(), fmt::colorize_rule(kind),
                       fmt::truncate(t.title, 48),
                       fmt::format_age_days(t.created_at, now),
                       fmt::format_timestamp(t.expires_at)});
    }
  }
  std::println("\n{} pending task(s)", total);
  return 0;
}

auto cmd_needs_analysis(const NeedsAnalysisOptions &opts) -> int {
  auto app = detail::open_application(opts.config_file, std::nullopt);
  if (!app) {
    return 1;
  }

  auto due = app->block_on(app->engine().query_content_needing_analysis());
  if (!due) {
    std::println(stderr, "Error: {}", due.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue out = JsonValue::object_t{};
    for (const auto &[kind, contents] : *due) {
      JsonValue arr = std::vector<JsonValue>{};
      for (const auto &c : contents) {
        arr.get_array().emplace_back(detail::content_to_json(c));
      }
      out[std::string(to_string_view(kind))] = std::move(arr);
    }
    std::println("{}", dump_json(out));
    return 0;
  }

  const auto now = std::chrono::system_clock::now();
  for (const auto &[kind, contents] : *due) {
    std::println("{} ({})", fmt::colorize_rule(kind), contents.size());
    if (contents.empty()) {
      std::println("  {}", fmt::ansi::dim("nothing due"));
      continue;
    }
    for (const auto &c : contents) {
      std::println("  {:<48} {}", fmt::truncate(c.topic, 48),
                   fmt::format_age_days(c.updated_at, now));
    }
  }
  return 0;
}

} // namespace contentflow::cli
