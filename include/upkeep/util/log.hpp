#pragma once

#include "upkeep/util/log_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace upkeep::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(1024);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger: producers format into a thread-local buffer and hand the
// line to a single writer thread. Falls back to a synchronous write when the
// queue is full or the writer is not running.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;
  static constexpr std::chrono::milliseconds IDLE_WAIT{200};

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  LogQueue queue_{QUEUE_CAPACITY};
  std::thread writer_;

  std::mutex sink_mu_;
  std::FILE* sink_{stdout};
  bool owns_sink_{false};

  auto write(std::string_view line) -> void {
    std::lock_guard lock(sink_mu_);
    std::fwrite(line.data(), 1, line.size(), sink_);
  }

  auto flush() -> void {
    std::lock_guard lock(sink_mu_);
    std::fflush(sink_);
  }

  auto write_batch(const std::vector<std::string>& batch) -> void {
    std::lock_guard lock(sink_mu_);
    for (const auto& line : batch) {
      std::fwrite(line.data(), 1, line.size(), sink_);
    }
    std::fflush(sink_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    while (running_.load(std::memory_order_acquire)) {
      if (queue_.drain(batch, IDLE_WAIT) > 0) {
        write_batch(batch);
      }
    }
    // stop() closes the queue before clearing running_, so nothing is
    // accepted after this drain.
    if (queue_.drain(batch, std::chrono::milliseconds{0}) > 0) {
      write_batch(batch);
    }
  }

  [[nodiscard]] auto colored() const noexcept -> bool {
    return sink_ == stdout || sink_ == stderr;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    std::lock_guard lock(sink_mu_);
    if (owns_sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    queue_.open();
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    if (!running_.load(std::memory_order_acquire))
      return;
    queue_.close();
    if (!running_.exchange(false))
      return;
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Lines written synchronously because the queue was full or closed.
  [[nodiscard]] auto overflowed() const -> std::size_t {
    return queue_.rejected();
  }

  // Redirects output to an append-mode file. Returns false (and keeps the
  // current sink) if the file cannot be opened.
  auto set_output_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::lock_guard lock(sink_mu_);
    if (owns_sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto& buf = t_buffer.buffer;
    buf.clear();
    if (colored()) {
      std::format_to(std::back_inserter(buf), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                     time, level_color(level), level_name(level), "\033[0m",
                     tid);
    } else {
      std::format_to(std::back_inserter(buf), "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] ",
                     time, level_name(level), tid);
    }
    std::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    buf.push_back('\n');

    if (!queue_.try_push(std::string(buf))) {
      write(buf);
      flush();
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace upkeep::log
