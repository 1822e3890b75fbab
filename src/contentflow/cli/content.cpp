#include "contentflow/cli/command_support.hpp"
#include "contentflow/cli/commands.hpp"
#include "contentflow/cli/formatting.hpp"
#include "contentflow/util/id.hpp"
#include "contentflow/util/json.hpp"

#include <chrono>
#include <print>
#include <string>

namespace contentflow::cli {

auto cmd_add_content(const AddContentOptions &opts) -> int {
  if (opts.topic.empty()) {
    std::println(stderr, "Error: topic must not be empty");
    return 1;
  }
  auto stage = parse<ContentStage>(opts.stage);
  if (!stage) {
    std::println(stderr, "Error: Unknown stage '{}'", opts.stage);
    return 1;
  }
  if (opts.published_days_ago && *opts.published_days_ago < 0) {
    std::println(stderr, "Error: --days-ago must not be negative");
    return 1;
  }

  auto app = detail::open_application(opts.config_file, std::nullopt);
  if (!app) {
    return 1;
  }

  const auto now = std::chrono::system_clock::now();
  // Re-adding a topic updates it in place and keeps its id and flags.
  Content content = app->store().content_by_topic(opts.topic).value_or(
      Content{.id = generate_content_id(), .topic = opts.topic});
  content.stage = *stage;
  content.updated_at =
      now - std::chrono::days(opts.published_days_ago.value_or(0));

  if (auto r = app->save_content(content); !r) {
    std::println(stderr, "Error: Failed to save content: {}",
                 r.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(detail::content_to_json(content)));
    return 0;
  }
  std::println("Saved '{}' ({}) as {}", content.topic, content.id,
               fmt::colorize_stage(content.stage));
  return 0;
}

} // namespace contentflow::cli
