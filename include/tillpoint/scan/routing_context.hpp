#pragma once

#include <tillpoint/core/clock.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace tillpoint::scan {

/// Per-screen scan state: reentrant suspension counter and the last committed
/// token used for duplicate suppression. Owned by the terminal, one per screen.
class RoutingContext {
 public:
  /// Nestable; each suspend() needs a matching resume().
  void suspend() noexcept { ++suspensions_; }
  void resume() noexcept {
    if (suspensions_ > 0) --suspensions_;
  }
  [[nodiscard]] bool suspended() const noexcept { return suspensions_ > 0; }
  [[nodiscard]] int suspension_depth() const noexcept { return suspensions_; }

  /// True if token equals the last committed token and was committed less than window ago.
  [[nodiscard]] bool is_duplicate(std::string_view token,
                                  core::TimePoint now,
                                  core::Millis window) const;

  void remember(std::string token, core::TimePoint now);

  [[nodiscard]] const std::string& last_token() const noexcept { return last_token_; }

 private:
  int suspensions_{0};
  std::string last_token_;
  std::optional<core::TimePoint> last_committed_at_;
};

}  // namespace tillpoint::scan
