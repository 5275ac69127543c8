#include "dgramipc/poll-events.hpp"

#include <poll.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <string_view>

#include "dgramipc/log.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/timedef.hpp"

namespace dgramipc {

namespace {

static_assert(PollIn == POLLIN, "PollIn value mismatch");
static_assert(PollErr == POLLERR, "PollErr value mismatch");
static_assert(PollHup == POLLHUP, "PollHup value mismatch");
static_assert(PollNval == POLLNVAL, "PollNval value mismatch");

int RemainingMs(SteadyTimePoint deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
  return static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, remaining.count()));
}

}  // namespace

PollResult PollOne(NativeHandle fd, PollEventBmp events, int timeoutMs) noexcept {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = static_cast<short>(events);

  const auto deadline = SteadyClock::now() + std::chrono::milliseconds{std::max(timeoutMs, 0)};
  while (true) {
    pfd.revents = 0;
    const int ret = ::poll(&pfd, 1, timeoutMs);
    if (ret != -1) {
      return {ret, static_cast<PollEventBmp>(pfd.revents)};
    }
    if (LastSystemError() != error::kInterrupted) {
      return {-1, 0};
    }
    if (timeoutMs > 0) {
      timeoutMs = RemainingMs(deadline);
    }
    log::trace("poll on fd # {} interrupted, resuming with timeout {}ms", fd, timeoutMs);
  }
}

std::string PollEventsToString(PollEventBmp revents) {
  static constexpr struct {
    PollEventBmp bit;
    std::string_view name;
  } kNames[] = {{PollIn, "POLLIN"}, {PollErr, "POLLERR"}, {PollHup, "POLLHUP"}, {PollNval, "POLLNVAL"}};

  std::string out;
  PollEventBmp unknown = revents;
  for (const auto& [bit, name] : kNames) {
    if ((revents & bit) != 0) {
      if (!out.empty()) {
        out.push_back('|');
      }
      out.append(name);
      unknown &= static_cast<PollEventBmp>(~bit);
    }
  }
  if (unknown != 0) {
    if (!out.empty()) {
      out.push_back('|');
    }
    out.append(std::format("0x{:x}", unknown));
  }
  if (out.empty()) {
    out = "none";
  }
  return out;
}

}  // namespace dgramipc
