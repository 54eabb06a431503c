#pragma once

#include <tillpoint/core/clock.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tillpoint::core {

using TimerId = std::uint64_t;

/// Single-threaded one-shot timers for the terminal event loop.
/// Callbacks run only inside run_due(), in deadline order (ties by schedule order),
/// and may schedule or cancel other timers. Not thread-safe.
class TimerQueue {
 public:
  explicit TimerQueue(const IClock& clock) : clock_(clock) {}

  TimerId schedule_after(Millis delay, std::function<void()> callback);

  /// Returns false if the timer already fired or was cancelled.
  bool cancel(TimerId id);

  /// Fires every timer whose deadline is <= clock.now(); returns how many fired.
  std::size_t run_due();

  [[nodiscard]] bool is_pending(TimerId id) const { return index_.contains(id); }
  [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
  [[nodiscard]] std::optional<TimePoint> next_deadline() const;

 private:
  using Key = std::pair<TimePoint, TimerId>;

  const IClock& clock_;
  std::map<Key, std::function<void()>> timers_;
  std::unordered_map<TimerId, TimePoint> index_;
  TimerId next_id_{1};
};

}  // namespace tillpoint::core
