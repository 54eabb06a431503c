#include <tillpoint/core/clock.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tillpoint::core {

namespace {

// 2025-01-01T00:00:00Z; a fixed start keeps replayed sessions reproducible.
constexpr std::chrono::seconds kManualWallStart{1735689600};

}  // namespace

ManualClock::ManualClock() : ManualClock(WallTime{kManualWallStart}) {}

ManualClock::ManualClock(WallTime wall_start) : wall_(wall_start) {}

std::string format_iso8601_utc(WallTime t) {
  const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t - secs).count();
  const std::time_t tt = std::chrono::system_clock::to_time_t(secs);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << ms << 'Z';
  return oss.str();
}

long long epoch_millis(WallTime t) noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}  // namespace tillpoint::core
