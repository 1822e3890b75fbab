#pragma once

#include <glaze/json.hpp>

#include <string>

namespace contentflow {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

} // namespace contentflow
