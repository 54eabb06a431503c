#pragma once

#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/timer_queue.hpp>
#include <tillpoint/scan/key_event.hpp>
#include <tillpoint/scan/routing_context.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tillpoint::scan {

/// Timing and acceptance rules for one decoder instance.
struct DecoderOptions {
  core::Millis inactivity{150};     // commit after this long without a character
  std::size_t min_length{4};        // shorter tokens are discarded
  std::string extra_chars{"-_."};   // accepted besides [A-Za-z0-9]

  /// Page-level decoder used on every screen.
  [[nodiscard]] static DecoderOptions global();
  /// Product-form barcode field: faster timeout, alphanumeric only, more than 6 characters.
  [[nodiscard]] static DecoderOptions product_form();
};

enum class DecoderState : std::uint8_t {
  Idle,
  Accumulating,
};

/// What a single key did to the decoder.
enum class KeyResult : std::uint8_t {
  Filtered,   // editable focus or suspended page; nothing touched
  Ignored,    // unaccepted key; buffer and timer kept
  Buffered,   // appended, inactivity timer re-armed
  Committed,  // token emitted
  Discarded,  // commit attempted below min_length; buffer cleared
};

using TokenCallback = std::function<void(const std::string& token)>;

/// Keystroke state machine that rebuilds barcode tokens from a scanner burst.
///
/// IDLE -> ACCUMULATING on the first accepted character; Enter or the
/// inactivity timer commits (emit if long enough, else discard) and returns
/// to IDLE with an empty buffer. Each accepted character cancels the pending
/// timer and arms a new one. The decoder owns its buffer and timer and reads
/// the suspension counter of the page's RoutingContext.
class ScanDecoder {
 public:
  ScanDecoder(DecoderOptions options,
              core::TimerQueue& timers,
              const RoutingContext& context,
              TokenCallback on_token);
  ~ScanDecoder();

  ScanDecoder(const ScanDecoder&) = delete;
  ScanDecoder& operator=(const ScanDecoder&) = delete;

  KeyResult on_key(const KeyEvent& event);

  /// Drops the buffer and cancels the pending timer without emitting.
  void reset();

  [[nodiscard]] DecoderState state() const noexcept {
    return buffer_.empty() ? DecoderState::Idle : DecoderState::Accumulating;
  }
  [[nodiscard]] const std::string& buffer() const noexcept { return buffer_; }
  [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }

 private:
  [[nodiscard]] bool accepts(char c) const;
  void cancel_timer();
  KeyResult commit();

  DecoderOptions options_;
  core::TimerQueue& timers_;
  const RoutingContext& context_;
  TokenCallback on_token_;

  std::string buffer_;
  std::optional<core::TimerId> pending_timer_;
};

}  // namespace tillpoint::scan
