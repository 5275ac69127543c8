#pragma once

#include <chrono>

namespace dgramipc {

// How long Receiver::read may suspend the calling thread.
class WaitPolicy {
 public:
  // Return immediately, whether a datagram is pending or not.
  static constexpr WaitPolicy NonBlocking() noexcept { return WaitPolicy(0); }

  // Block until a datagram or an abnormal event arrives.
  static constexpr WaitPolicy Infinite() noexcept { return WaitPolicy(-1); }

  // Block at most `timeout`.
  // Throws std::invalid_argument if timeout is negative,
  // std::overflow_error if it does not fit in poll's int milliseconds.
  static WaitPolicy Timeout(std::chrono::milliseconds timeout);

  [[nodiscard]] constexpr bool isNonBlocking() const noexcept { return _timeoutMs == 0; }
  [[nodiscard]] constexpr bool isInfinite() const noexcept { return _timeoutMs < 0; }

  // Timeout in poll(2) convention: 0 non-blocking, -1 infinite.
  [[nodiscard]] constexpr int pollTimeoutMs() const noexcept { return _timeoutMs; }

  constexpr bool operator==(const WaitPolicy&) const noexcept = default;

 private:
  explicit constexpr WaitPolicy(int timeoutMs) noexcept : _timeoutMs(timeoutMs) {}

  int _timeoutMs;
};

}  // namespace dgramipc
