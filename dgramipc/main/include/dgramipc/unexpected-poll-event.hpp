#pragma once

#include <stdexcept>

#include "dgramipc/poll-events.hpp"

namespace dgramipc {

// Thrown by Receiver::read when poll reports anything else than plain readability
// (POLLHUP, POLLERR, POLLNVAL, or several flags at once, POLLIN|POLLHUP included).
// Whatever the flags, the Receiver should be destroyed and constructed again.
class UnexpectedPollEvent : public std::runtime_error {
 public:
  explicit UnexpectedPollEvent(PollEventBmp revents);

  // Raw revents bitmap as returned by poll.
  [[nodiscard]] PollEventBmp revents() const noexcept { return _revents; }

 private:
  PollEventBmp _revents;
};

}  // namespace dgramipc
