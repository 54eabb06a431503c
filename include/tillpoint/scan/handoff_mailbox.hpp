#pragma once

#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/product.hpp>
#include <optional>
#include <string>

namespace tillpoint::scan {

/// Single-slot mailbox that carries a resolved product from another screen to
/// the sale screen. Each payload is delivered at most once; consuming the same
/// product id again within the grace window yields nothing, so a re-entered
/// sale screen cannot add it twice.
class HandoffMailbox {
 public:
  HandoffMailbox(const core::IClock& clock, core::Millis grace);

  /// Replaces any payload not yet consumed.
  void post(core::Product product);

  /// Empties the slot. Returns the payload unless it repeats the last consumed
  /// id within the grace window.
  [[nodiscard]] std::optional<core::Product> consume();

  [[nodiscard]] bool has_payload() const noexcept { return slot_.has_value(); }

  void clear() noexcept { slot_.reset(); }

 private:
  const core::IClock& clock_;
  core::Millis grace_;
  std::optional<core::Product> slot_;
  std::string last_consumed_id_;
  std::optional<core::TimePoint> last_consumed_at_;
};

}  // namespace tillpoint::scan
