#include <tillpoint/core/timer_queue.hpp>

namespace tillpoint::core {

TimerId TimerQueue::schedule_after(Millis delay, std::function<void()> callback) {
  const TimerId id = next_id_++;
  const TimePoint deadline = clock_.now() + delay;
  timers_.emplace(Key{deadline, id}, std::move(callback));
  index_.emplace(id, deadline);
  return id;
}

bool TimerQueue::cancel(TimerId id) {
  const auto it = index_.find(id);
  if (it == index_.end()) return false;
  timers_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

std::size_t TimerQueue::run_due() {
  std::size_t fired = 0;
  while (!timers_.empty()) {
    auto first = timers_.begin();
    if (first->first.first > clock_.now()) break;
    auto callback = std::move(first->second);
    index_.erase(first->first.second);
    timers_.erase(first);
    ++fired;
    if (callback) callback();
  }
  return fired;
}

std::optional<TimePoint> TimerQueue::next_deadline() const {
  if (timers_.empty()) return std::nullopt;
  return timers_.begin()->first.first;
}

}  // namespace tillpoint::core
