#include "contentflow/cli/commands.hpp"
#include "contentflow/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CONTENTFLOW_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target) -> void {
  cmd->add_option("-c,--config", target,
                  "Config file (default: $CONTENTFLOW_CONFIG or built-in "
                  "defaults)")
      ->check(CLI::ExistingFile);
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  contentflow::log::set_output_stderr();
  contentflow::log::set_level(contentflow::log::Level::Warn);

  CLI::App app{"contentflow",
               "Daily follow-up task automation for a content pipeline"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  contentflow serve -c contentflow.toml\n"
             "  contentflow add-content -c contentflow.toml \"My video\" "
             "--days-ago 3\n"
             "  contentflow run-now -c contentflow.toml\n"
             "  contentflow pending -c contentflow.toml --json\n"
             "\nTip: Set CONTENTFLOW_CONFIG=contentflow.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  contentflow::cli::ServeOptions serve_opts;
  serve_opts.config_file = env_config;
  auto *serve = app.add_subcommand(
      "serve", "Run the daily scheduler until SIGINT/SIGTERM (SIGUSR1 "
               "triggers a catch-up check)");
  add_config_option(serve, serve_opts.config_file);
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_flag("--no-startup-check", serve_opts.no_startup_check,
                  "Skip the catch-up check on start");
  serve->callback(
      [&serve_opts]() { std::exit(contentflow::cli::cmd_serve(serve_opts)); });

  contentflow::cli::RunNowOptions run_now_opts;
  run_now_opts.config_file = env_config;
  auto *run_now = app.add_subcommand(
      "run-now", "Run the daily rule evaluation now, regardless of the date");
  add_config_option(run_now, run_now_opts.config_file);
  run_now->add_option("--log-level", run_now_opts.log_level,
                      "Log level override: trace|debug|info|warn|error");
  run_now->add_flag("--json", run_now_opts.json, "Output JSON");
  run_now->callback([&run_now_opts]() {
    std::exit(contentflow::cli::cmd_run_now(run_now_opts));
  });

  contentflow::cli::CompleteOptions complete_opts;
  complete_opts.config_file = env_config;
  auto *complete = app.add_subcommand(
      "complete", "Complete a task and flag the content it was derived from");
  add_config_option(complete, complete_opts.config_file);
  complete->add_option("task_id", complete_opts.task_id, "Task ID")
      ->required();
  complete->add_option("--log-level", complete_opts.log_level,
                       "Log level override: trace|debug|info|warn|error");
  complete->add_flag("--json", complete_opts.json, "Output JSON");
  complete->callback([&complete_opts]() {
    std::exit(contentflow::cli::cmd_complete(complete_opts));
  });

  contentflow::cli::PendingOptions pending_opts;
  pending_opts.config_file = env_config;
  auto *pending =
      app.add_subcommand("pending", "List outstanding system tasks by rule");
  add_config_option(pending, pending_opts.config_file);
  pending->add_flag("--json", pending_opts.json, "Output JSON");
  pending->callback([&pending_opts]() {
    std::exit(contentflow::cli::cmd_pending(pending_opts));
  });

  contentflow::cli::NeedsAnalysisOptions needs_opts;
  needs_opts.config_file = env_config;
  auto *needs = app.add_subcommand(
      "needs-analysis", "List published content that is due for review");
  add_config_option(needs, needs_opts.config_file);
  needs->add_flag("--json", needs_opts.json, "Output JSON");
  needs->callback([&needs_opts]() {
    std::exit(contentflow::cli::cmd_needs_analysis(needs_opts));
  });

  contentflow::cli::StatusOptions status_opts;
  status_opts.config_file = env_config;
  auto *status =
      app.add_subcommand("status", "Show scheduler and store status");
  add_config_option(status, status_opts.config_file);
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback([&status_opts]() {
    std::exit(contentflow::cli::cmd_status(status_opts));
  });

  contentflow::cli::AddContentOptions add_opts;
  add_opts.config_file = env_config;
  auto *add_content =
      app.add_subcommand("add-content", "Add or update a content item");
  add_content->footer("\nExamples:\n"
                      "  contentflow add-content \"Intro to Rust\" "
                      "--days-ago 12\n"
                      "  contentflow add-content \"Draft topic\" --stage "
                      "scripted");
  add_config_option(add_content, add_opts.config_file);
  add_content->add_option("topic", add_opts.topic, "Content topic")
      ->required();
  add_content->add_option("--stage", add_opts.stage,
                          "Pipeline stage (default: published)");
  add_content->add_option("--days-ago", add_opts.published_days_ago,
                          "Days since the item reached its stage");
  add_content->add_flag("--json", add_opts.json, "Output JSON");
  add_content->callback([&add_opts]() {
    std::exit(contentflow::cli::cmd_add_content(add_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
