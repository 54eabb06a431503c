#include <tillpoint/scan/scan_decoder.hpp>
#include <tillpoint/core/text.hpp>
#include <spdlog/spdlog.h>
#include <cctype>

namespace tillpoint::scan {

DecoderOptions DecoderOptions::global() {
  return DecoderOptions{core::Millis{150}, 4, "-_."};
}

DecoderOptions DecoderOptions::product_form() {
  return DecoderOptions{core::Millis{100}, 7, ""};
}

ScanDecoder::ScanDecoder(DecoderOptions options,
                         core::TimerQueue& timers,
                         const RoutingContext& context,
                         TokenCallback on_token)
    : options_(std::move(options)),
      timers_(timers),
      context_(context),
      on_token_(std::move(on_token)) {}

ScanDecoder::~ScanDecoder() { cancel_timer(); }

bool ScanDecoder::accepts(char c) const {
  if (std::isalnum(static_cast<unsigned char>(c))) return true;
  return options_.extra_chars.find(c) != std::string::npos;
}

void ScanDecoder::cancel_timer() {
  if (pending_timer_) {
    timers_.cancel(*pending_timer_);
    pending_timer_.reset();
  }
}

KeyResult ScanDecoder::on_key(const KeyEvent& event) {
  if (context_.suspended() || is_editable(event.target)) {
    return KeyResult::Filtered;
  }

  if (event.is_enter()) {
    return commit();
  }

  if (!event.is_character() || !accepts(event.key.front())) {
    return KeyResult::Ignored;
  }

  buffer_.push_back(event.key.front());
  cancel_timer();
  pending_timer_ = timers_.schedule_after(options_.inactivity, [this]() {
    pending_timer_.reset();
    commit();
  });
  return KeyResult::Buffered;
}

KeyResult ScanDecoder::commit() {
  cancel_timer();
  std::string token = core::trim_copy(buffer_);
  buffer_.clear();

  if (token.size() < options_.min_length) {
    if (!token.empty()) {
      spdlog::debug("[scan] discarded short buffer '{}'", token);
    }
    return KeyResult::Discarded;
  }

  spdlog::debug("[scan] committed token '{}'", token);
  if (on_token_) on_token_(token);
  return KeyResult::Committed;
}

void ScanDecoder::reset() {
  cancel_timer();
  buffer_.clear();
}

}  // namespace tillpoint::scan
