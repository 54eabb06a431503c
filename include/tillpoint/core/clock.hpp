#pragma once

#include <chrono>
#include <string>

namespace tillpoint::core {

using Millis = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

/// Time source for timers, dedup windows and transaction stamps.
/// Injected everywhere so tests can run on virtual time.
class IClock {
 public:
  virtual ~IClock() = default;

  /// Monotonic time; used for every interval computation.
  [[nodiscard]] virtual TimePoint now() const = 0;

  /// Wall-clock time; used only for transaction ids and timestamps.
  [[nodiscard]] virtual WallTime wall_now() const = 0;
};

class SystemClock : public IClock {
 public:
  [[nodiscard]] TimePoint now() const override { return std::chrono::steady_clock::now(); }
  [[nodiscard]] WallTime wall_now() const override { return std::chrono::system_clock::now(); }
};

/// Virtual clock that only moves when advance() is called (tests, scripted replay).
class ManualClock : public IClock {
 public:
  ManualClock();
  explicit ManualClock(WallTime wall_start);

  [[nodiscard]] TimePoint now() const override { return now_; }
  [[nodiscard]] WallTime wall_now() const override { return wall_; }

  void advance(Millis delta) noexcept {
    now_ += delta;
    wall_ += delta;
  }

 private:
  TimePoint now_{};
  WallTime wall_{};
};

/// ISO-8601 UTC with millisecond precision, e.g. 2025-12-01T01:23:45.678Z.
[[nodiscard]] std::string format_iso8601_utc(WallTime t);

/// Milliseconds since the Unix epoch.
[[nodiscard]] long long epoch_millis(WallTime t) noexcept;

}  // namespace tillpoint::core
