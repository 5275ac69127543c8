#pragma once

#include <cstdint>
#include <string>

#include "dgramipc/platform.hpp"

namespace dgramipc {

// Bitmap of poll(2) events, same bit values as the POLL* macros.
using PollEventBmp = uint16_t;

inline constexpr PollEventBmp PollIn = 0x001;
inline constexpr PollEventBmp PollErr = 0x008;
inline constexpr PollEventBmp PollHup = 0x010;
inline constexpr PollEventBmp PollNval = 0x020;

struct PollResult {
  // Number of ready descriptors (0 on timeout), or -1 on failure with errno set.
  int nbReady;
  PollEventBmp revents;
};

// Poll a single descriptor for `events` (POLLERR, POLLHUP and POLLNVAL are always reported).
// timeoutMs follows poll(2): 0 returns immediately, a negative value waits forever.
// A call interrupted by a signal is resumed with the remaining time.
[[nodiscard]] PollResult PollOne(NativeHandle fd, PollEventBmp events, int timeoutMs) noexcept;

// Human readable list of the flags set in `revents`, for instance "POLLIN|POLLHUP".
[[nodiscard]] std::string PollEventsToString(PollEventBmp revents);

}  // namespace dgramipc
