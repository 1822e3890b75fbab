#pragma once

#include "contentflow/core/error.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace contentflow::util {

/// Read entire file into a string.
[[nodiscard]] inline auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Write through a sibling temp file and rename, so readers never observe a
/// half-written document.
[[nodiscard]] inline auto write_file_atomic(const std::filesystem::path &path,
                                            std::string_view contents)
    -> Result<void> {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
      return fail(Error::StorageError);
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

} // namespace contentflow::util
