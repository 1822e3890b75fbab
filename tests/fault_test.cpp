#include "contentflow/core/error.hpp"
#include "contentflow/core/fault.hpp"

#include "gtest/gtest.h"

#include <stdexcept>
#include <system_error>

using namespace contentflow;

TEST(FaultTest, OwnCodesClassify) {
  EXPECT_EQ(classify(make_error_code(Error::NetworkError)),
            ErrorClass::Transient);
  EXPECT_EQ(classify(make_error_code(Error::Timeout)), ErrorClass::Transient);
  EXPECT_EQ(classify(make_error_code(Error::ServerError)),
            ErrorClass::Transient);
  EXPECT_EQ(classify(make_error_code(Error::ValidationFailed)),
            ErrorClass::Permanent);
  EXPECT_EQ(classify(make_error_code(Error::Unauthorized)),
            ErrorClass::Permanent);
  EXPECT_EQ(classify(make_error_code(Error::NotFound)), ErrorClass::NotFound);
  EXPECT_EQ(classify(make_error_code(Error::StorageError)),
            ErrorClass::Unclassified);
}

TEST(FaultTest, SystemCodesClassify) {
  EXPECT_EQ(classify(std::make_error_code(std::errc::timed_out)),
            ErrorClass::Transient);
  EXPECT_EQ(classify(std::make_error_code(std::errc::connection_refused)),
            ErrorClass::Transient);
  EXPECT_EQ(classify(std::make_error_code(std::errc::permission_denied)),
            ErrorClass::Permanent);
  EXPECT_EQ(classify(std::make_error_code(std::errc::no_such_file_or_directory)),
            ErrorClass::NotFound);
}

TEST(FaultTest, MessageTextClassifiesUnknownCodes) {
  const auto unknown = make_error_code(Error::Unknown);
  EXPECT_EQ(classify(Fault{unknown, "Network request failed"}),
            ErrorClass::Transient);
  EXPECT_EQ(classify(Fault{unknown, "request TIMED OUT"}),
            ErrorClass::Transient);
  EXPECT_EQ(classify(Fault{unknown, "Failed to fetch"}), ErrorClass::Transient);
  EXPECT_EQ(classify(Fault{unknown, "HTTP 503 Service Unavailable"}),
            ErrorClass::Transient);
  EXPECT_EQ(classify(Fault{unknown, "title is required"}),
            ErrorClass::Permanent);
  EXPECT_EQ(classify(Fault{unknown, "Forbidden"}), ErrorClass::Permanent);
  EXPECT_EQ(classify(Fault{unknown, "row not found"}), ErrorClass::NotFound);
  EXPECT_EQ(classify(Fault{unknown, "something odd"}),
            ErrorClass::Unclassified);
}

TEST(FaultTest, FiveHundredMustBeStandalone) {
  const auto unknown = make_error_code(Error::Unknown);
  EXPECT_EQ(classify(Fault{unknown, "order 15034 rejected"}),
            ErrorClass::Unclassified);
  EXPECT_EQ(classify(Fault{unknown, "status 500"}), ErrorClass::Transient);
}

TEST(FaultTest, OnlyTransientIsRetryable) {
  EXPECT_TRUE(is_retryable(Fault{make_error_code(Error::RateLimited)}));
  EXPECT_FALSE(is_retryable(Fault{make_error_code(Error::ValidationFailed)}));
  EXPECT_FALSE(is_retryable(Fault{make_error_code(Error::NotFound)}));
  EXPECT_FALSE(is_retryable(Fault{make_error_code(Error::Unknown)}));
}

TEST(FaultTest, MessagePrefersDetail) {
  Fault bare{make_error_code(Error::NotFound)};
  EXPECT_EQ(bare.message(), "not found");
  Fault detailed{make_error_code(Error::NotFound), "task 42 is gone"};
  EXPECT_EQ(detailed.message(), "task 42 is gone");
}

TEST(FaultTest, ExceptionsAreCoerced) {
  auto from_runtime = fault_from_exception(
      std::make_exception_ptr(std::runtime_error("network down")));
  EXPECT_EQ(from_runtime.code, make_error_code(Error::Unknown));
  EXPECT_EQ(from_runtime.detail, "network down");
  EXPECT_EQ(classify(from_runtime), ErrorClass::Transient);

  auto from_system = fault_from_exception(std::make_exception_ptr(
      std::system_error(std::make_error_code(std::errc::timed_out), "poll")));
  EXPECT_EQ(from_system.code, std::make_error_code(std::errc::timed_out));

  auto from_invalid = fault_from_exception(
      std::make_exception_ptr(std::invalid_argument("bad id")));
  EXPECT_EQ(from_invalid.code, make_error_code(Error::InvalidArgument));

  auto from_int = fault_from_exception(std::make_exception_ptr(7));
  EXPECT_EQ(from_int.code, make_error_code(Error::Unknown));
  EXPECT_FALSE(from_int.detail.empty());
}

TEST(FaultTest, UnwrapRethrows) {
  Outcome<int> good{5};
  EXPECT_EQ(unwrap(std::move(good)), 5);

  Outcome<int> bad{std::unexpected(Fault{make_error_code(Error::Forbidden)})};
  EXPECT_THROW((void)unwrap(std::move(bad)), std::system_error);
}

TEST(FaultTest, ErrorClassNames) {
  EXPECT_EQ(to_string_view(ErrorClass::Transient), "transient");
  EXPECT_EQ(to_string_view(ErrorClass::NotFound), "not_found");
  EXPECT_EQ(parse<ErrorClass>("permanent"), ErrorClass::Permanent);
}
