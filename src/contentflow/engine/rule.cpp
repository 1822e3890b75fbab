#include "contentflow/model/rule.hpp"

#include <format>

namespace contentflow {

auto Rule::title_for(std::string_view topic) const -> std::string {
  return std::format("{}{}", title_prefix, topic);
}

auto Rule::description_for(std::string_view topic) const -> std::string {
  return std::vformat(description_template, std::make_format_args(topic));
}

auto Rule::topic_from_title(std::string_view title) const
    -> std::optional<std::string> {
  if (!title.starts_with(title_prefix) || title.size() == title_prefix.size()) {
    return std::nullopt;
  }
  return std::string(title.substr(title_prefix.size()));
}

auto Rule::is_due(const Content &content,
                  std::chrono::system_clock::time_point now) const -> bool {
  return is_terminal(content.stage) && !content.has_flag(flag) &&
         now - content.updated_at >= threshold;
}

auto default_rules(RuleThresholds thresholds) -> std::vector<Rule> {
  return {
      Rule{
          .kind = RuleKind::FansFeedback,
          .threshold = thresholds.fans_feedback,
          .flag = ContentFlag::FansFeedbackAnalysed,
          .title_prefix = "Analyse Fans Feedback on ",
          .description_template =
              "Review and analyze fan feedback for \"{}\" content. Check "
              "comments, engagement metrics, and audience response.",
      },
      Rule{
          .kind = RuleKind::OverallFeedback,
          .threshold = thresholds.overall_feedback,
          .flag = ContentFlag::OverallFeedbackAnalysed,
          .title_prefix = "Analyse Overall Feedback on ",
          .description_template =
              "Conduct comprehensive analysis of overall feedback for \"{}\" "
              "content. Review performance metrics, audience retention, and "
              "long-term impact.",
      },
  };
}

auto content_edit_link(const ContentId &id) -> std::string {
  return std::format("/content/edit/{}", id);
}

} // namespace contentflow
