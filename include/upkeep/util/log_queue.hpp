#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace upkeep::log {

// Formatted lines waiting for the log writer thread. Producers append under a
// short lock; the writer takes everything pending in one swap. A full or
// closed queue rejects the line so the caller can write it directly.
class LogQueue {
public:
  explicit LogQueue(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {
    pending_.reserve(capacity_);
  }

  LogQueue(const LogQueue&) = delete;
  LogQueue& operator=(const LogQueue&) = delete;

  [[nodiscard]] auto try_push(std::string line) -> bool {
    {
      std::lock_guard lock(mu_);
      if (closed_ || pending_.size() >= capacity_) {
        ++rejected_;
        return false;
      }
      pending_.push_back(std::move(line));
    }
    ready_.notify_one();
    return true;
  }

  // Moves every pending line into `out` (cleared first), waiting up to `wait`
  // for the first one. Returns the number of lines taken.
  auto drain(std::vector<std::string>& out, std::chrono::milliseconds wait)
      -> std::size_t {
    out.clear();
    std::unique_lock lock(mu_);
    if (pending_.empty() && !closed_ && wait.count() > 0) {
      ready_.wait_for(lock, wait,
                      [this] { return closed_ || !pending_.empty(); });
    }
    pending_.swap(out);
    pending_.reserve(capacity_);
    return out.size();
  }

  auto open() -> void {
    std::lock_guard lock(mu_);
    closed_ = false;
  }

  // Wakes a waiting drain(); later pushes are rejected.
  auto close() -> void {
    {
      std::lock_guard lock(mu_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return pending_.size();
  }

  [[nodiscard]] auto rejected() const -> std::size_t {
    std::lock_guard lock(mu_);
    return rejected_;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable ready_;
  std::vector<std::string> pending_;
  std::size_t rejected_{0};
  bool closed_{true};
};

}  // namespace upkeep::log
