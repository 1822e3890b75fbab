#include "contentflow/engine/task_rules_engine.hpp"

#include "contentflow/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <string>
#include <utility>

namespace contentflow {

TaskRulesEngine::TaskRulesEngine(ContentRepository &contents,
                                 TaskRepository &tasks,
                                 ErrorReporter &reporter, RetryExecutor &retry,
                                 std::vector<Rule> rules, Clock clock)
    : contents_(contents), tasks_(tasks), reporter_(reporter), retry_(retry),
      rules_(std::move(rules)), clock_(std::move(clock)) {}

auto TaskRulesEngine::now() const -> TimePoint {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

auto TaskRulesEngine::find_rule(RuleKind kind) const -> const Rule * {
  auto it = std::ranges::find(rules_, kind, &Rule::kind);
  return it == rules_.end() ? nullptr : &*it;
}

auto TaskRulesEngine::match_task(const Task &task) const
    -> std::optional<Match> {
  if (task.correlation) {
    if (const auto *rule = find_rule(task.correlation->rule)) {
      return Match{.rule = rule, .content_id = task.correlation->content_id};
    }
    return std::nullopt;
  }
  for (const auto &rule : rules_) {
    if (auto topic = rule.topic_from_title(task.title)) {
      return Match{.rule = &rule, .topic = std::move(topic)};
    }
  }
  return std::nullopt;
}

auto TaskRulesEngine::is_derived_from(const Task &task, const Rule &rule,
                                      const Content &content) const -> bool {
  if (task.correlation) {
    return task.correlation->rule == rule.kind &&
           task.correlation->content_id == content.id;
  }
  return task.title == rule.title_for(content.topic);
}

auto TaskRulesEngine::evaluate_item(const Rule &rule, const Content &content)
    -> task<Result<std::optional<Task>>> {
  auto existing = co_await tasks_.list_tasks(TaskType::System);
  if (!existing) {
    reporter_.report(Fault{existing.error()},
                     std::format("Checking {} tasks for '{}' failed: {}",
                                 to_string_view(rule.kind), content.topic,
                                 existing.error().message()));
    co_return fail(existing.error());
  }
  const bool exists = std::ranges::any_of(*existing, [&](const Task &t) {
    return is_derived_from(t, rule, content);
  });
  if (exists) {
    co_return ok(std::optional<Task>{});
  }

  TaskDraft draft{
      .title = rule.title_for(content.topic),
      .description = rule.description_for(content.topic),
      .type = TaskType::System,
      .link = content_edit_link(content.id),
      .correlation =
          TaskCorrelation{.content_id = content.id, .rule = rule.kind},
  };
  // Terminal failures are reported by the retry executor.
  auto created = co_await retry_.execute(
      std::format("Create task '{}'", draft.title),
      [this, draft]() { return tasks_.create_task(draft); });
  if (!created) {
    co_return fail(created.error().code);
  }
  log::info("Created system task '{}' ({})", created->title, created->id);
  co_return ok(std::optional<Task>{std::move(*created)});
}

auto TaskRulesEngine::evaluate_rules() -> task<Result<EvaluationReport>> {
  EvaluationReport report;
  const auto at = now();

  for (const auto &rule : rules_) {
    auto published = co_await contents_.list_published_content();
    if (!published) {
      log::error("Listing published content failed: {}",
                 published.error().message());
      co_return fail(published.error());
    }

    auto &created = report.created[rule.kind];
    for (const auto &content : *published) {
      if (!rule.is_due(content, at)) {
        continue;
      }
      Result<std::optional<Task>> item;
      try {
        item = co_await evaluate_item(rule, content);
      } catch (...) {
        // A throwing repository costs this item only.
        const auto fault = fault_from_exception(std::current_exception());
        reporter_.report(fault,
                         std::format("Checking {} tasks for '{}' failed: {}",
                                     to_string_view(rule.kind), content.topic,
                                     fault.message()));
        item = fail(fault.code);
      }
      if (!item) {
        ++report.failures;
        log::warn("Skipping '{}' for rule {}: {}", content.topic,
                  to_string_view(rule.kind), item.error().message());
        continue;
      }
      if (*item) {
        created.push_back(std::move(**item));
      }
    }
  }

  log::info("Rule evaluation created {} task(s), {} failure(s)",
            report.total_created(), report.failures);
  co_return ok(std::move(report));
}

auto TaskRulesEngine::complete_derived_task(TaskId task_id)
    -> task<Result<CompletionReport>> {
  auto found = co_await tasks_.find_task(task_id);
  if (!found) {
    co_return fail(found.error());
  }
  if (!*found) {
    co_return fail(Error::NotFound);
  }

  CompletionReport report{.task = std::move(**found)};
  const auto match = match_task(report.task);

  if (match) {
    report.rule = match->rule->kind;

    Result<std::optional<Content>> content;
    if (match->content_id) {
      content = co_await contents_.find_content(*match->content_id);
    } else {
      content = co_await contents_.find_content_by_topic(*match->topic);
    }
    if (!content) {
      co_return fail(content.error());
    }

    if (*content) {
      const auto content_id = (*content)->id;
      const auto flag = match->rule->flag;
      auto flagged = co_await retry_.execute(
          std::format("Mark {} on '{}'", to_string_view(flag),
                      (*content)->topic),
          [this, content_id, flag]() {
            return contents_.add_content_flag(content_id, flag);
          });
      if (!flagged) {
        co_return fail(flagged.error().code);
      }
      report.content = std::move(*flagged);
    } else {
      log::warn("Content for task '{}' no longer exists, completing anyway",
                report.task.title);
    }
  }

  auto removed = co_await retry_.execute(
      std::format("Complete task '{}'", report.task.title),
      [this, id = report.task.id]() { return tasks_.remove_task(id); });
  if (!removed) {
    co_return fail(removed.error().code);
  }

  log::info("Completed task '{}' ({})", report.task.title, report.task.id);
  co_return ok(std::move(report));
}

auto TaskRulesEngine::query_pending_tasks()
    -> task<Result<std::map<RuleKind, std::vector<Task>>>> {
  auto system_tasks = co_await tasks_.list_tasks(TaskType::System);
  if (!system_tasks) {
    co_return fail(system_tasks.error());
  }

  std::map<RuleKind, std::vector<Task>> grouped;
  for (const auto &rule : rules_) {
    grouped[rule.kind];
  }
  for (auto &t : *system_tasks) {
    if (auto match = match_task(t)) {
      grouped[match->rule->kind].push_back(std::move(t));
    }
  }
  co_return ok(std::move(grouped));
}

auto TaskRulesEngine::query_content_needing_analysis()
    -> task<Result<std::map<RuleKind, std::vector<Content>>>> {
  auto published = co_await contents_.list_published_content();
  if (!published) {
    co_return fail(published.error());
  }

  const auto at = now();
  std::map<RuleKind, std::vector<Content>> out;
  for (const auto &rule : rules_) {
    auto &bucket = out[rule.kind];
    std::ranges::copy_if(*published, std::back_inserter(bucket),
                         [&](const Content &c) { return rule.is_due(c, at); });
  }
  co_return ok(std::move(out));
}

auto TaskRulesEngine::sweep_expired_tasks() -> task<Result<std::size_t>> {
  const auto at = now();
  auto removed = co_await retry_.execute(
      "Clean up expired tasks",
      [this, at]() { return tasks_.remove_expired_tasks(at); });
  if (!removed) {
    co_return fail(removed.error().code);
  }
  if (*removed > 0) {
    log::info("Cleaned up {} expired task(s)", *removed);
  }
  co_return ok(*removed);
}

} // namespace contentflow
