#pragma once

#include "contentflow/core/error.hpp"
#include "contentflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace contentflow {

// How a failure should be treated by the resilience layer.
enum class ErrorClass : std::uint8_t {
  Transient,    // network / timeout / connection / 5xx; retryable
  Permanent,    // validation / authorization; never retried
  NotFound,     // referenced task or content does not exist
  Unclassified, // unknown condition; fail fast
};
BOOST_DESCRIBE_ENUM(ErrorClass, Transient, Permanent, NotFound, Unclassified)
CONTENTFLOW_DEFINE_ENUM_SERDE(ErrorClass)

// A failure value: an error code plus the free-form text that came with it
// (an exception's what(), a transport message). Exceptions thrown by wrapped
// operations are coerced into this shape.
struct Fault {
  std::error_code code{make_error_code(Error::Unknown)};
  std::string detail;

  Fault() = default;
  Fault(std::error_code ec) : code(ec) {} // NOLINT(google-explicit-constructor)
  Fault(std::error_code ec, std::string text)
      : code(ec), detail(std::move(text)) {}

  [[nodiscard]] auto message() const -> std::string {
    return detail.empty() ? code.message() : detail;
  }
};

template <typename T> using Outcome = std::expected<T, Fault>;

[[nodiscard]] auto classify(const Fault &fault) -> ErrorClass;

[[nodiscard]] inline auto classify(std::error_code ec) -> ErrorClass {
  return classify(Fault{ec});
}

// Default retry condition: only transient failures are retried.
[[nodiscard]] inline auto is_retryable(const Fault &fault) -> bool {
  return classify(fault) == ErrorClass::Transient;
}

[[nodiscard]] auto fault_from_exception(std::exception_ptr eptr) -> Fault;

// Explicit rethrow path for callers that prefer exceptions over Outcome.
template <typename T> auto unwrap(Outcome<T> outcome) -> T {
  if (!outcome) {
    throw std::system_error(outcome.error().code, outcome.error().message());
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*outcome);
  }
}

} // namespace contentflow
