#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/model/content.hpp"
#include "contentflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace contentflow {

enum class RuleKind : std::uint8_t {
  FansFeedback,
  OverallFeedback,
};
BOOST_DESCRIBE_ENUM(RuleKind, FansFeedback, OverallFeedback)
CONTENTFLOW_DEFINE_ENUM_SERDE(RuleKind)

// "Published content older than `threshold` without `flag` needs a task".
struct Rule {
  RuleKind kind{RuleKind::FansFeedback};
  std::chrono::days threshold{0};
  ContentFlag flag{ContentFlag::FansFeedbackAnalysed};
  std::string_view title_prefix;
  // Single "{}" placeholder, replaced by the content topic.
  std::string_view description_template;

  [[nodiscard]] auto title_for(std::string_view topic) const -> std::string;
  [[nodiscard]] auto description_for(std::string_view topic) const
      -> std::string;

  // Recovers the topic from a derived task title. A topic that itself
  // contains another rule's prefix can still be attributed to the wrong rule;
  // correlated tasks never go through this path.
  [[nodiscard]] auto topic_from_title(std::string_view title) const
      -> std::optional<std::string>;

  [[nodiscard]] auto is_due(const Content &content,
                            std::chrono::system_clock::time_point now) const
      -> bool;
};

struct RuleThresholds {
  std::chrono::days fans_feedback{rules::kFansFeedbackThreshold};
  std::chrono::days overall_feedback{rules::kOverallFeedbackThreshold};
};

[[nodiscard]] auto default_rules(RuleThresholds thresholds = {})
    -> std::vector<Rule>;

[[nodiscard]] auto content_edit_link(const ContentId &id) -> std::string;

} // namespace contentflow
