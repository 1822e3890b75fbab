#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace contentflow {

// Phantom tags keep content and task ids from being mixed up.
struct ContentTag {};
struct TaskTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using ContentId = TypedId<ContentTag>;
using TaskId = TypedId<TaskTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_task_id() -> TaskId {
  return TaskId{detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto generate_content_id() -> ContentId {
  return ContentId{detail::generate_uuid_v7_like()};
}

} // namespace contentflow

template <typename Tag> struct std::hash<contentflow::TypedId<Tag>> {
  auto operator()(const contentflow::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<contentflow::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const contentflow::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
