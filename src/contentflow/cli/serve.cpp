#include "contentflow/app/application.hpp"
#include "contentflow/cli/command_support.hpp"
#include "contentflow/cli/commands.hpp"
#include "contentflow/util/log.hpp"

#include <print>
#include <string>
#include <unistd.h>

namespace contentflow::cli {

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = detail::load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    if (!log::parse_level(*opts.log_level)) {
      std::println(stderr, "Error: Unknown log level '{}'", *opts.log_level);
      return 1;
    }
    config.log.level = *opts.log_level;
  }
  if (opts.no_startup_check) {
    config.scheduler.check_on_start = false;
  }

  const auto log_file = opts.log_file.value_or(config.log.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.log.level);
  log::start();

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  log::info("contentflow serving (pid {})", ::getpid());
  auto served = app.serve();
  if (!served) {
    log::error("Service stopped with error: {}", served.error().message());
  } else {
    log::info("contentflow stopped");
  }
  log::stop();
  return served ? 0 : 1;
}

} // namespace contentflow::cli
