#include <tillpoint/scan/handoff_mailbox.hpp>
#include <spdlog/spdlog.h>

namespace tillpoint::scan {

HandoffMailbox::HandoffMailbox(const core::IClock& clock, core::Millis grace)
    : clock_(clock), grace_(grace) {}

void HandoffMailbox::post(core::Product product) {
  slot_ = std::move(product);
}

std::optional<core::Product> HandoffMailbox::consume() {
  if (!slot_) return std::nullopt;

  core::Product payload = std::move(*slot_);
  slot_.reset();

  const core::TimePoint now = clock_.now();
  if (last_consumed_at_ && payload.id == last_consumed_id_ &&
      now - *last_consumed_at_ < grace_) {
    spdlog::debug("[handoff] dropped repeated delivery of {}", payload.id);
    return std::nullopt;
  }

  last_consumed_id_ = payload.id;
  last_consumed_at_ = now;
  return payload;
}

}  // namespace tillpoint::scan
