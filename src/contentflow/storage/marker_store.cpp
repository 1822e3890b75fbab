#include "contentflow/storage/marker_store.hpp"

#include "contentflow/util/file.hpp"
#include "contentflow/util/log.hpp"

#include <glaze/json.hpp>

#include <utility>

namespace contentflow {

auto MemoryMarkerStore::get(std::string_view key)
    -> Result<std::optional<std::string>> {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return ok(std::optional<std::string>{});
  }
  return ok(std::optional<std::string>{it->second});
}

auto MemoryMarkerStore::set(std::string_view key, std::string value)
    -> Result<void> {
  values_.insert_or_assign(std::string(key), std::move(value));
  return ok();
}

FileMarkerStore::FileMarkerStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto FileMarkerStore::open(std::filesystem::path path)
    -> Result<std::unique_ptr<FileMarkerStore>> {
  std::unique_ptr<FileMarkerStore> store(new FileMarkerStore(std::move(path)));
  auto text = util::read_file(store->path_);
  if (!text) {
    return ok(std::move(store));
  }

  std::map<std::string, std::string> raw;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(raw, *text); ec) {
    log::error("Marker file {} is not valid JSON: {}", store->path_.string(),
               glz::format_error(ec, *text));
    return fail(Error::ParseError);
  }
  for (auto &[key, value] : raw) {
    store->values_.emplace(key, std::move(value));
  }
  return ok(std::move(store));
}

auto FileMarkerStore::get(std::string_view key)
    -> Result<std::optional<std::string>> {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return ok(std::optional<std::string>{});
  }
  return ok(std::optional<std::string>{it->second});
}

auto FileMarkerStore::set(std::string_view key, std::string value)
    -> Result<void> {
  auto updated = values_;
  updated.insert_or_assign(std::string(key), std::move(value));

  std::map<std::string, std::string> raw(updated.begin(), updated.end());
  auto out = glz::write_json(raw);
  if (!out) {
    return fail(Error::StorageError);
  }
  if (auto r = util::write_file_atomic(path_, *out); !r) {
    log::error("Failed to write marker file {}: {}", path_.string(),
               r.error().message());
    return r;
  }
  values_ = std::move(updated);
  return ok();
}

} // namespace contentflow
