#include "dgramipc/unexpected-poll-event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "dgramipc/poll-events.hpp"

namespace dgramipc {

TEST(UnexpectedPollEventTest, CarriesRawEvents) {
  const UnexpectedPollEvent ex(PollHup | PollErr);
  EXPECT_EQ(ex.revents(), PollHup | PollErr);
  EXPECT_STREQ(ex.what(), "unexpected poll event: POLLERR|POLLHUP");
}

TEST(UnexpectedPollEventTest, IsARuntimeError) {
  try {
    throw UnexpectedPollEvent(PollNval);
  } catch (const std::runtime_error& e) {
    EXPECT_EQ(std::string_view(e.what()), "unexpected poll event: POLLNVAL");
  }
}

}  // namespace dgramipc
