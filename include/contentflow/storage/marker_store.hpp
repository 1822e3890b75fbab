#pragma once

#include "contentflow/storage/repository.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace contentflow {

class MemoryMarkerStore final : public MarkerStore {
public:
  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<std::string>> override;
  [[nodiscard]] auto set(std::string_view key, std::string value)
      -> Result<void> override;

private:
  std::map<std::string, std::string, std::less<>> values_;
};

// Flat JSON object of string values, rewritten on every set().
class FileMarkerStore final : public MarkerStore {
public:
  [[nodiscard]] static auto open(std::filesystem::path path)
      -> Result<std::unique_ptr<FileMarkerStore>>;

  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<std::string>> override;
  [[nodiscard]] auto set(std::string_view key, std::string value)
      -> Result<void> override;

private:
  explicit FileMarkerStore(std::filesystem::path path);

  std::filesystem::path path_;
  std::map<std::string, std::string, std::less<>> values_;
};

} // namespace contentflow
