#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace contentflow::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "",
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Asynchronous line logger. Producers format on their own thread and hand the
// line to a writer thread through a bounded channel; before start() (and
// after stop()) lines are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *owned_file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::shared_ptr<LineChannel> channel_;
  std::jthread writer_;

  auto write_line(std::string_view line) -> void {
    auto *out = output_.load(std::memory_order_acquire);
    std::fwrite(line.data(), 1, line.size(), out);
  }

  auto writer_loop(std::shared_ptr<LineChannel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    for (;;) {
      batch.clear();
      boost::system::error_code recv_ec;
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(line));
            }
          });
      channel_ctx_.restart();
      (void)channel_ctx_.run_one();
      if (recv_ec || batch.empty()) {
        break;
      }

      while (batch.size() < kBatchSize &&
             channel->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }

      for (const auto &line : batch) {
        write_line(line);
      }
      std::fflush(output_.load(std::memory_order_acquire));
    }

    // Flush whatever was queued before the channel closed.
    while (channel->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            write_line(line);
          }
        })) {
    }
    std::fflush(output_.load(std::memory_order_acquire));
  }

  [[nodiscard]] static auto render(Level level, std::string_view message,
                                   bool color) -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    if (color) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", now,
                         level_color(level), level_name(level), "\o{33}[0m",
                         message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", now,
                       level_name(level), message);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owned_file_) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    channel_ctx_.restart();
    channel_ =
        std::make_shared<LineChannel>(channel_ctx_.get_executor(),
                                      kQueueCapacity);
    writer_ = std::jthread([this, channel = channel_] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (channel_) {
      channel_->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  // Only honoured while stopped; the writer thread owns the stream otherwise.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (owned_file_) {
      std::fclose(owned_file_);
    }
    owned_file_ = f;
    return true;
  }

  auto set_output_stderr() -> void {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    output_.store(stderr, std::memory_order_release);
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto *out = output_.load(std::memory_order_acquire);
    const bool color = ::isatty(::fileno(out)) != 0;
    auto line = render(level, std::format(fmt, std::forward<Args>(args)...),
                       color);

    if (!running_.load(std::memory_order_acquire)) {
      std::fwrite(line.data(), 1, line.size(), out);
      std::fflush(out);
      return;
    }
    if (!channel_->try_send(boost::system::error_code{}, std::move(line))) {
      // Never block a coroutine thread on a full queue.
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace contentflow::log
