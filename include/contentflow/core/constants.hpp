#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace contentflow {

namespace rules {
constexpr auto kFansFeedbackThreshold = std::chrono::days(2);
constexpr auto kOverallFeedbackThreshold = std::chrono::days(10);
constexpr auto kTaskTimeToLive = std::chrono::days(7);
} // namespace rules

namespace timing {
constexpr auto kCatchupPollInterval = std::chrono::hours(1);
// Task-list consumers refresh every 5 minutes; the core never arms that timer.
} // namespace timing

namespace retry_defaults {
constexpr int kMaxAttempts = 3;
constexpr auto kBaseDelay = std::chrono::milliseconds(1000);
constexpr double kBackoffFactor = 2.0;
constexpr auto kMaxDelay = std::chrono::milliseconds(10000);
} // namespace retry_defaults

namespace storage {
constexpr std::string_view kLastRunMarkerKey = "last_task_check";
constexpr std::size_t kErrorHistoryCapacity = 256;
} // namespace storage

} // namespace contentflow
