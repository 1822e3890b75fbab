#pragma once

#include "contentflow/app/application.hpp"
#include "contentflow/config/config.hpp"
#include "contentflow/model/content.hpp"
#include "contentflow/model/task.hpp"
#include "contentflow/util/json.hpp"
#include "contentflow/util/log.hpp"
#include "contentflow/util/time.hpp"

#include <cstdint>

#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace contentflow::cli::detail {

inline auto load_config_or_print(std::string_view path)
    -> Result<ServiceConfig> {
  auto loaded = path.empty() ? ConfigLoader::load_defaults()
                             : ConfigLoader::load_from_file(path);
  return loaded.or_else([&](std::error_code ec) -> Result<ServiceConfig> {
    if (path.empty()) {
      std::println(stderr, "Error: {}", ec.message());
    } else {
      std::println(stderr, "Error: {}: {}", path, ec.message());
    }
    return fail(ec);
  });
}

// Loads the config and initialises an Application for a one-shot command.
// Log output stays on stderr so stdout carries only command output.
inline auto open_application(std::string_view config_file,
                             const std::optional<std::string> &log_level)
    -> std::unique_ptr<Application> {
  log::set_output_stderr();
  auto config = load_config_or_print(config_file);
  if (!config) {
    return nullptr;
  }
  log::set_level(log_level.value_or(config->log.level));

  auto app = std::make_unique<Application>(std::move(*config));
  if (auto r = app->init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return nullptr;
  }
  return app;
}

inline auto task_to_json(const Task &t) -> JsonValue {
  JsonValue obj{
      {"id", t.id.str()},
      {"title", t.title},
      {"description", t.description},
      {"type", std::string(to_string_view(t.type))},
      {"created_at", util::format_iso8601(t.created_at)},
      {"expires_at", util::format_iso8601(t.expires_at)},
  };
  if (t.link) {
    obj["link"] = *t.link;
  }
  if (t.correlation) {
    obj["content_id"] = t.correlation->content_id.str();
    obj["rule"] = std::string(to_string_view(t.correlation->rule));
  }
  return obj;
}

inline auto content_to_json(const Content &c) -> JsonValue {
  JsonValue flags = std::vector<JsonValue>{};
  for (auto flag : c.flags) {
    flags.get_array().emplace_back(std::string(to_string_view(flag)));
  }
  return JsonValue{
      {"id", c.id.str()},
      {"topic", c.topic},
      {"stage", std::string(to_string_view(c.stage))},
      {"flags", std::move(flags)},
      {"updated_at", util::format_iso8601(c.updated_at)},
  };
}

} // namespace contentflow::cli::detail
