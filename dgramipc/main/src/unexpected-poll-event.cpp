#include "dgramipc/unexpected-poll-event.hpp"

#include <stdexcept>
#include <string>

#include "dgramipc/poll-events.hpp"

namespace dgramipc {

UnexpectedPollEvent::UnexpectedPollEvent(PollEventBmp revents)
    : std::runtime_error("unexpected poll event: " + PollEventsToString(revents)), _revents(revents) {}

}  // namespace dgramipc
