#pragma once

#include "contentflow/util/enum.hpp"
#include "contentflow/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace contentflow {

enum class ContentStage : std::uint8_t {
  Pending,
  Title,
  Thumbnail,
  ToC,
  Ordered,
  Scripted,
  Recorded,
  VoiceEdited,
  Edited,
  Revised,
  SeoOptimised,
  Published,
};
BOOST_DESCRIBE_ENUM(ContentStage, Pending, Title, Thumbnail, ToC, Ordered,
                    Scripted, Recorded, VoiceEdited, Edited, Revised,
                    SeoOptimised, Published)
CONTENTFLOW_DEFINE_ENUM_SERDE(ContentStage)

inline constexpr std::size_t kStageCount = 12;
inline constexpr ContentStage kTerminalStage = ContentStage::Published;

inline constexpr std::array<std::string_view, kStageCount> kStageLabels = {
    "Pending", "Title",        "Thumbnail",     "ToC",
    "Ordered", "Scripted",     "Recorded",      "Voice Edited",
    "Edited",  "Revised",      "SEO Optimised", "Published"};

[[nodiscard]] inline auto stage_label(ContentStage stage) -> std::string_view {
  return kStageLabels.at(std::to_underlying(stage));
}

[[nodiscard]] constexpr auto is_terminal(ContentStage stage) noexcept -> bool {
  return stage == kTerminalStage;
}

// Marks that a human finished the review a rule asked for.
enum class ContentFlag : std::uint8_t {
  FansFeedbackAnalysed,
  OverallFeedbackAnalysed,
};
BOOST_DESCRIBE_ENUM(ContentFlag, FansFeedbackAnalysed, OverallFeedbackAnalysed)
CONTENTFLOW_DEFINE_ENUM_SERDE(ContentFlag)

struct Content {
  ContentId id;
  std::string topic;
  ContentStage stage{ContentStage::Pending};
  std::vector<ContentFlag> flags;
  std::chrono::system_clock::time_point updated_at{};

  [[nodiscard]] auto has_flag(ContentFlag flag) const -> bool {
    return std::ranges::find(flags, flag) != flags.end();
  }

  // Flags only ever accumulate. Returns false when already present.
  auto add_flag(ContentFlag flag) -> bool {
    if (has_flag(flag)) {
      return false;
    }
    flags.push_back(flag);
    return true;
  }
};

} // namespace contentflow
