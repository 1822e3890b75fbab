#pragma once

#include "contentflow/model/rule.hpp"
#include "contentflow/util/enum.hpp"
#include "contentflow/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace contentflow {

enum class TaskType : std::uint8_t { User, System };
BOOST_DESCRIBE_ENUM(TaskType, User, System)
CONTENTFLOW_DEFINE_ENUM_SERDE(TaskType)

// Stable identity of a derived task: which content, which rule.
struct TaskCorrelation {
  ContentId content_id;
  RuleKind rule{RuleKind::FansFeedback};

  auto operator==(const TaskCorrelation &) const -> bool = default;
};

struct Task {
  TaskId id;
  std::string title;
  std::string description;
  TaskType type{TaskType::User};
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point expires_at{};
  std::optional<std::string> link;
  std::optional<TaskCorrelation> correlation;

  [[nodiscard]] auto is_expired(std::chrono::system_clock::time_point now) const
      -> bool {
    return expires_at <= now;
  }
};

// Input to TaskRepository::create_task. The repository assigns id and
// created_at and fills expires_at from its TTL when absent.
struct TaskDraft {
  std::string title;
  std::string description;
  TaskType type{TaskType::User};
  std::optional<std::chrono::system_clock::time_point> expires_at;
  std::optional<std::string> link;
  std::optional<TaskCorrelation> correlation;
};

} // namespace contentflow
