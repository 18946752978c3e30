#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace stepflow::log {

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

// Async logger: producers append to a bounded queue, one writer thread drains
// it in batches to stdout and, when configured, a log file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  struct Line {
    Level level;
    std::string text;
  };

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Line> queue_;
  std::FILE* file_{nullptr};
  std::thread writer_;

  auto emit(const Line& line) -> void {
    std::print("[{}{}{}] {}", level_color(line.level), level_name(line.level),
               "\033[0m", line.text);
    if (file_ != nullptr) {
      std::print(file_, "[{}] {}", level_name(line.level), line.text);
    }
  }

  auto writer_loop() -> void {
    std::vector<Line> batch;
    batch.reserve(BATCH_SIZE);

    for (;;) {
      {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] {
          return !queue_.empty() || !running_.load(std::memory_order_acquire);
        });
        while (!queue_.empty() && batch.size() < BATCH_SIZE) {
          batch.push_back(std::move(queue_.front()));
          queue_.pop_front();
        }
        if (batch.empty() && !running_.load(std::memory_order_acquire)) {
          break;
        }
      }
      for (const auto& line : batch) {
        emit(line);
      }
      batch.clear();
      std::fflush(stdout);
      if (file_ != nullptr) {
        std::fflush(file_);
      }
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(mu_);
      if (!running_.exchange(false))
        return;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Must be called before start(). Returns false if the file cannot be opened.
  auto open_file(const std::string& path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    auto* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    if (file_ != nullptr) {
      std::fclose(file_);
    }
    file_ = f;
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
    Line line{level, std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", time, tid,
                                 std::format(fmt, std::forward<Args>(args)...))};

    {
      std::unique_lock lock(mu_);
      if (running_.load(std::memory_order_acquire) &&
          queue_.size() < QUEUE_CAPACITY) {
        queue_.push_back(std::move(line));
        lock.unlock();
        cv_.notify_one();
        return;
      }
      // Not started, shutting down or full: write synchronously.
      emit(line);
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

inline auto open_file(const std::string& path) -> bool {
  return logger().open_file(path);
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

}  // namespace stepflow::log
