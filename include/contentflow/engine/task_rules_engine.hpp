#pragma once

#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/model/content.hpp"
#include "contentflow/model/rule.hpp"
#include "contentflow/model/task.hpp"
#include "contentflow/resilience/error_reporter.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/storage/repository.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace contentflow {

struct EvaluationReport {
  std::map<RuleKind, std::vector<Task>> created;
  std::size_t failures{0};

  [[nodiscard]] auto total_created() const -> std::size_t {
    std::size_t total = 0;
    for (const auto &[kind, tasks] : created) {
      total += tasks.size();
    }
    return total;
  }
};

struct CompletionReport {
  Task task;
  std::optional<RuleKind> rule;    // unset for a plain (non-derived) task
  std::optional<Content> content;  // content after the flag was applied
};

// Turns "published content past a rule's threshold without the rule's flag"
// into one outstanding system task, and a completed task back into the flag.
//
// Reads go straight to the repositories; every mutation goes through the
// RetryExecutor. Invocations are not mutually excluded: two overlapping
// evaluate_rules() calls can both create a task for the same pair.
class TaskRulesEngine {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using Clock = std::function<TimePoint()>;

  TaskRulesEngine(ContentRepository &contents, TaskRepository &tasks,
                  ErrorReporter &reporter, RetryExecutor &retry,
                  std::vector<Rule> rules = default_rules(), Clock clock = {});

  TaskRulesEngine(const TaskRulesEngine &) = delete;
  auto operator=(const TaskRulesEngine &) -> TaskRulesEngine & = delete;

  // Per-item failures are reported, counted and skipped. Only a failure to
  // list published content aborts the run.
  auto evaluate_rules() -> task<Result<EvaluationReport>>;

  // Flags the content the task was derived from (if it still exists) and
  // deletes the task. Error::NotFound when the task does not exist.
  auto complete_derived_task(TaskId task_id) -> task<Result<CompletionReport>>;

  auto query_pending_tasks()
      -> task<Result<std::map<RuleKind, std::vector<Task>>>>;
  auto query_content_needing_analysis()
      -> task<Result<std::map<RuleKind, std::vector<Content>>>>;

  // Deletes tasks whose expires_at has passed; returns how many went.
  auto sweep_expired_tasks() -> task<Result<std::size_t>>;

  [[nodiscard]] auto rules() const noexcept -> const std::vector<Rule> & {
    return rules_;
  }

private:
  struct Match {
    const Rule *rule{nullptr};
    std::optional<ContentId> content_id; // correlated tasks
    std::optional<std::string> topic;    // title fallback
  };

  [[nodiscard]] auto now() const -> TimePoint;
  [[nodiscard]] auto find_rule(RuleKind kind) const -> const Rule *;
  [[nodiscard]] auto match_task(const Task &task) const -> std::optional<Match>;
  [[nodiscard]] auto is_derived_from(const Task &task, const Rule &rule,
                                     const Content &content) const -> bool;

  auto evaluate_item(const Rule &rule, const Content &content)
      -> task<Result<std::optional<Task>>>;

  ContentRepository &contents_;
  TaskRepository &tasks_;
  ErrorReporter &reporter_;
  RetryExecutor &retry_;
  std::vector<Rule> rules_;
  Clock clock_;
};

} // namespace contentflow
