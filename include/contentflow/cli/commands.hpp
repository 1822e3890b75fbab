#pragma once

#include <optional>
#include <string>

namespace contentflow::cli {

// An empty config_file means built-in defaults plus CONTENTFLOW_* overrides.

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool no_startup_check{false};
};

struct RunNowOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  bool json{false};
};

struct CompleteOptions {
  std::string config_file;
  std::string task_id;
  std::optional<std::string> log_level;
  bool json{false};
};

struct PendingOptions {
  std::string config_file;
  bool json{false};
};

struct NeedsAnalysisOptions {
  std::string config_file;
  bool json{false};
};

struct StatusOptions {
  std::string config_file;
  bool json{false};
};

struct AddContentOptions {
  std::string config_file;
  std::string topic;
  std::string stage{"published"};
  std::optional<int> published_days_ago;
  bool json{false};
};

auto cmd_serve(const ServeOptions &opts) -> int;
auto cmd_run_now(const RunNowOptions &opts) -> int;
auto cmd_complete(const CompleteOptions &opts) -> int;
auto cmd_pending(const PendingOptions &opts) -> int;
auto cmd_needs_analysis(const NeedsAnalysisOptions &opts) -> int;
auto cmd_status(const StatusOptions &opts) -> int;
auto cmd_add_content(const AddContentOptions &opts) -> int;

} // namespace contentflow::cli
