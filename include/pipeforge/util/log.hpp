#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace pipeforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and handed to a single writer
// thread through a channel. Before start() and after stop() lines are
// written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<std::shared_ptr<LineChannel>> channel_;
  std::atomic<std::uint64_t> dropped_{0};
  boost::asio::io_context writer_ctx_{1};
  std::jthread writer_;

  std::mutex out_mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
  std::atomic<bool> color_{false};

  auto write_line(std::string_view line) -> void {
    std::scoped_lock lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto receive_next(std::shared_ptr<LineChannel> channel) -> void {
    auto *raw = channel.get();
    raw->async_receive([this, channel = std::move(channel)](
                           boost::system::error_code ec, std::string line) {
      if (ec) {
        return;
      }
      write_line(line);
      receive_next(channel);
    });
  }

  auto refresh_color() -> void {
    color_.store(::isatty(::fileno(out_)) != 0, std::memory_order_release);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (channel_.load(std::memory_order_acquire)) {
      return;
    }
    writer_ctx_.restart();
    auto channel =
        std::make_shared<LineChannel>(writer_ctx_.get_executor(), kQueueCapacity);
    receive_next(channel);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this] { writer_ctx_.run(); });
  }

  auto stop() -> void {
    auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel);
    if (!channel) {
      return;
    }
    boost::asio::post(writer_ctx_, [this, channel] {
      for (;;) {
        std::optional<std::string> line;
        const bool got = channel->try_receive(
            [&](boost::system::error_code ec, std::string item) {
              if (!ec) {
                line = std::move(item);
              }
            });
        if (!got) {
          break;
        }
        if (line) {
          write_line(*line);
        }
      }
      channel->close();
    });
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

  auto set_output_stderr() -> void {
    std::scoped_lock lock(out_mu_);
    out_ = stderr;
    refresh_color();
  }

  /// Append to `path`; an empty path switches back to stderr.
  auto set_output_file(std::string_view path) -> bool {
    std::scoped_lock lock(out_mu_);
    if (path.empty()) {
      out_ = stderr;
    } else {
      FILE *f = std::fopen(std::string(path).c_str(), "a");
      if (f == nullptr) {
        return false;
      }
      std::setvbuf(f, nullptr, _IOLBF, 0);
      out_ = f;
    }
    if (file_ != nullptr && file_ != out_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (out_ != stderr && out_ != stdout) {
      file_ = out_;
    }
    refresh_color();
    return true;
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

    const auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    const bool colored = color_.load(std::memory_order_acquire);
    const auto color = colored ? level_colors.at(std::to_underlying(level))
                               : std::string_view{};
    auto line = std::format(
        "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time, color,
        level_name(level), colored ? "\o{33}[0m" : "", tid,
        std::format(fmt, std::forward<Args>(args)...));

    auto channel = channel_.load(std::memory_order_acquire);
    if (!channel) {
      write_line(line);
      return;
    }
    if (!channel->try_send(boost::system::error_code{}, std::move(line))) {
      // Never block a runtime thread on a full queue.
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

/// Unknown names fall back to info.
inline auto set_level(std::string_view name) -> void {
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

} // namespace pipeforge::log
