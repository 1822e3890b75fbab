#include "contentflow/resilience/error_reporter.hpp"

#include "contentflow/util/log.hpp"

#include <utility>

namespace contentflow {

LogErrorReporter::LogErrorReporter(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

auto LogErrorReporter::report(const Fault &fault, std::string_view context,
                              ReportMeta meta) -> void {
  ++total_;
  if (meta.attempt) {
    log::error("{} [class={}, attempt={}]", context,
               to_string_view(classify(fault)), *meta.attempt);
  } else {
    log::error("{} [class={}]", context, to_string_view(classify(fault)));
  }

  if (history_.size() == capacity_) {
    history_.pop_front();
  }
  history_.push_back(ReportedError{.fault = fault,
                                   .context = std::string(context),
                                   .meta = meta,
                                   .at = std::chrono::system_clock::now()});
}

auto LogErrorReporter::history() const -> std::vector<ReportedError> {
  return {history_.begin(), history_.end()};
}

auto LogErrorReporter::clear() -> void { history_.clear(); }

} // namespace contentflow
