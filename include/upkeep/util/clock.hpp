#pragma once

#include <atomic>
#include <chrono>

namespace upkeep {

using TimePoint = std::chrono::system_clock::time_point;

// Time source. Components that compare timestamps (cache expiry, checkpoint
// staleness, lock expiry, next-run computation) read time through a Clock so
// tests can drive it deterministically.
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const -> TimePoint override {
    return std::chrono::system_clock::now();
  }
};

// Process-wide wall clock.
[[nodiscard]] inline auto system_clock() -> const Clock& {
  static const SystemClock instance;
  return instance;
}

class ManualClock final : public Clock {
public:
  explicit ManualClock(TimePoint start = TimePoint{std::chrono::seconds{1'700'000'000}})
      : now_(start.time_since_epoch().count()) {
  }

  [[nodiscard]] auto now() const -> TimePoint override {
    return TimePoint{TimePoint::duration{now_.load(std::memory_order_acquire)}};
  }

  auto set(TimePoint tp) -> void {
    now_.store(tp.time_since_epoch().count(), std::memory_order_release);
  }

  template <typename Rep, typename Period>
  auto advance(std::chrono::duration<Rep, Period> d) -> void {
    auto delta = std::chrono::duration_cast<TimePoint::duration>(d).count();
    now_.fetch_add(delta, std::memory_order_acq_rel);
  }

private:
  std::atomic<TimePoint::duration::rep> now_;
};

}  // namespace upkeep
