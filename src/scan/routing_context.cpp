#include <tillpoint/scan/routing_context.hpp>

namespace tillpoint::scan {

bool RoutingContext::is_duplicate(std::string_view token,
                                  core::TimePoint now,
                                  core::Millis window) const {
  if (!last_committed_at_ || token != last_token_) return false;
  return now - *last_committed_at_ < window;
}

void RoutingContext::remember(std::string token, core::TimePoint now) {
  last_token_ = std::move(token);
  last_committed_at_ = now;
}

}  // namespace tillpoint::scan
