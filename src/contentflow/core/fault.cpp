#include "contentflow/core/fault.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <array>
#include <cctype>
#include <stdexcept>

namespace contentflow {
namespace {

constexpr std::array<std::string_view, 5> kTransientPatterns = {
    "network", "timeout", "timed out", "fetch", "rate limit"};

constexpr std::array<std::string_view, 6> kPermanentPatterns = {
    "validation", "invalid",      "required",
    "permission", "unauthorized", "forbidden"};

[[nodiscard]] auto is_digit(char c) -> bool {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// True when the text carries a standalone three digit 5xx status ("HTTP 503").
[[nodiscard]] auto mentions_5xx_status(std::string_view text) -> bool {
  for (std::size_t i = 0; i + 3 <= text.size(); ++i) {
    if (text[i] != '5' || !is_digit(text[i + 1]) || !is_digit(text[i + 2])) {
      continue;
    }
    const bool left_ok = i == 0 || !is_digit(text[i - 1]);
    const bool right_ok = i + 3 == text.size() || !is_digit(text[i + 3]);
    if (left_ok && right_ok) {
      return true;
    }
  }
  return false;
}

[[nodiscard]] auto contains_any(std::string_view text, auto const &patterns)
    -> bool {
  for (auto pattern : patterns) {
    if (boost::algorithm::icontains(text, pattern)) {
      return true;
    }
  }
  return false;
}

[[nodiscard]] auto classify_own(Error e) -> ErrorClass {
  switch (e) {
  case Error::Timeout:
  case Error::NetworkError:
  case Error::ConnectionFailed:
  case Error::ServerError:
  case Error::RateLimited:
  case Error::Offline:
    return ErrorClass::Transient;
  case Error::InvalidArgument:
  case Error::ValidationFailed:
  case Error::Unauthorized:
  case Error::Forbidden:
  case Error::AlreadyExists:
  case Error::InvalidState:
  case Error::ParseError:
    return ErrorClass::Permanent;
  case Error::NotFound:
  case Error::FileNotFound:
    return ErrorClass::NotFound;
  default:
    return ErrorClass::Unclassified;
  }
}

[[nodiscard]] auto classify_errc(std::error_code ec) -> ErrorClass {
  if (ec == std::errc::timed_out || ec == std::errc::connection_refused ||
      ec == std::errc::connection_reset ||
      ec == std::errc::connection_aborted || ec == std::errc::network_down ||
      ec == std::errc::network_unreachable || ec == std::errc::network_reset ||
      ec == std::errc::host_unreachable || ec == std::errc::not_connected ||
      ec == std::errc::broken_pipe) {
    return ErrorClass::Transient;
  }
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted ||
      ec == std::errc::invalid_argument) {
    return ErrorClass::Permanent;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return ErrorClass::NotFound;
  }
  return ErrorClass::Unclassified;
}

[[nodiscard]] auto classify_text(std::string_view text) -> ErrorClass {
  if (contains_any(text, kTransientPatterns) || mentions_5xx_status(text)) {
    return ErrorClass::Transient;
  }
  if (contains_any(text, kPermanentPatterns)) {
    return ErrorClass::Permanent;
  }
  if (boost::algorithm::icontains(text, "not found")) {
    return ErrorClass::NotFound;
  }
  return ErrorClass::Unclassified;
}

} // namespace

auto classify(const Fault &fault) -> ErrorClass {
  if (fault.code.category() == error_category()) {
    auto cls = classify_own(static_cast<Error>(fault.code.value()));
    if (cls != ErrorClass::Unclassified) {
      return cls;
    }
  } else if (fault.code) {
    auto cls = classify_errc(fault.code);
    if (cls != ErrorClass::Unclassified) {
      return cls;
    }
  }
  // Codes we cannot interpret fall back to the accompanying text.
  return classify_text(fault.detail);
}

auto fault_from_exception(std::exception_ptr eptr) -> Fault {
  if (!eptr) {
    return Fault{make_error_code(Error::Unknown)};
  }
  try {
    std::rethrow_exception(eptr);
  } catch (const std::system_error &e) {
    return Fault{e.code(), e.what()};
  } catch (const std::invalid_argument &e) {
    return Fault{make_error_code(Error::InvalidArgument), e.what()};
  } catch (const std::exception &e) {
    return Fault{make_error_code(Error::Unknown), e.what()};
  } catch (...) {
    return Fault{make_error_code(Error::Unknown), "non-standard exception"};
  }
}

} // namespace contentflow
