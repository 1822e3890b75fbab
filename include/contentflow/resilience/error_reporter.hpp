#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/core/fault.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace contentflow {

struct ReportMeta {
  std::optional<int> attempt;
};

// Error sink. Every terminal failure the resilience layer gives up on, and
// every failed daily run, ends up here exactly once.
class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;

  virtual auto report(const Fault &fault, std::string_view context,
                      ReportMeta meta = {}) -> void = 0;
};

struct ReportedError {
  Fault fault;
  std::string context;
  ReportMeta meta;
  std::chrono::system_clock::time_point at;
};

// Logs each report at error level and keeps the most recent ones.
class LogErrorReporter final : public ErrorReporter {
public:
  explicit LogErrorReporter(
      std::size_t capacity = storage::kErrorHistoryCapacity);

  auto report(const Fault &fault, std::string_view context,
              ReportMeta meta = {}) -> void override;

  [[nodiscard]] auto history() const -> std::vector<ReportedError>;
  [[nodiscard]] auto total_reported() const noexcept -> std::size_t {
    return total_;
  }
  auto clear() -> void;

private:
  std::size_t capacity_;
  std::size_t total_{0};
  std::deque<ReportedError> history_;
};

} // namespace contentflow
