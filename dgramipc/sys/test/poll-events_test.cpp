#include "dgramipc/poll-events.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>

#define DGRAMIPC_WANT_SOCKET_OVERRIDES

#include "dgramipc/base-fd.hpp"
#include "dgramipc/sys-test-support.hpp"

namespace dgramipc {

namespace {

struct SocketPair {
  SocketPair() {
    std::array<int, 2> fds{};
    if (::socketpair(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0, fds.data()) == 0) {
      first = BaseFd(fds[0]);
      second = BaseFd(fds[1]);
    }
  }

  BaseFd first;
  BaseFd second;
};

}  // namespace

TEST(PollEventsToString, Names) {
  EXPECT_EQ(PollEventsToString(0), "none");
  EXPECT_EQ(PollEventsToString(PollIn), "POLLIN");
  EXPECT_EQ(PollEventsToString(PollIn | PollHup), "POLLIN|POLLHUP");
  EXPECT_EQ(PollEventsToString(PollErr | PollHup | PollNval), "POLLERR|POLLHUP|POLLNVAL");
}

TEST(PollEventsToString, UnknownBitsAreReportedInHex) {
  EXPECT_EQ(PollEventsToString(0x4), "0x4");
  EXPECT_EQ(PollEventsToString(PollIn | 0x100), "POLLIN|0x100");
}

class PollOneTest : public ::testing::Test {
 protected:
  SocketPair pair;
  test::SocketActionsGuard actionsGuard;
};

TEST_F(PollOneTest, ZeroTimeoutOnIdleSocketReturnsImmediately) {
  ASSERT_TRUE(pair.first);
  const auto start = std::chrono::steady_clock::now();
  const auto res = PollOne(pair.first.fd(), PollIn, 0);
  EXPECT_EQ(res.nbReady, 0);
  EXPECT_EQ(res.revents, 0);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{500});
}

TEST_F(PollOneTest, TimeoutElapses) {
  ASSERT_TRUE(pair.first);
  const auto start = std::chrono::steady_clock::now();
  const auto res = PollOne(pair.first.fd(), PollIn, 50);
  EXPECT_EQ(res.nbReady, 0);
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{45});
}

TEST_F(PollOneTest, ReadableAfterWrite) {
  ASSERT_TRUE(pair.first);
  const char byte = 'x';
  ASSERT_EQ(1, ::send(pair.second.fd(), &byte, 1, 0));
  const auto res = PollOne(pair.first.fd(), PollIn, -1);
  EXPECT_EQ(res.nbReady, 1);
  EXPECT_EQ(res.revents, PollIn);
}

TEST_F(PollOneTest, ClosedDescriptorReportsNval) {
  ASSERT_TRUE(pair.first);
  const int fd = pair.first.fd();
  pair.first.close();
  const auto res = PollOne(fd, PollIn, 0);
  EXPECT_EQ(res.nbReady, 1);
  EXPECT_EQ(res.revents, PollNval);
}

TEST_F(PollOneTest, ShutdownReportsHangup) {
  ASSERT_TRUE(pair.first);
  ASSERT_EQ(0, ::shutdown(pair.first.fd(), SHUT_RDWR));
  const auto res = PollOne(pair.first.fd(), PollIn, 0);
  EXPECT_EQ(res.nbReady, 1);
  EXPECT_NE(res.revents & PollHup, 0);
}

TEST_F(PollOneTest, InterruptedPollIsResumed) {
  ASSERT_TRUE(pair.first);
  test::PushPollAction({-1, EINTR, 0});
  test::PushPollAction({-1, EINTR, 0});
  test::PushPollAction({1, 0, PollIn});
  const auto res = PollOne(pair.first.fd(), PollIn, -1);
  EXPECT_EQ(res.nbReady, 1);
  EXPECT_EQ(res.revents, PollIn);
}

TEST_F(PollOneTest, FailureIsReported) {
  ASSERT_TRUE(pair.first);
  test::PushPollAction({-1, EINVAL, 0});
  const auto res = PollOne(pair.first.fd(), PollIn, 0);
  EXPECT_EQ(res.nbReady, -1);
  EXPECT_EQ(errno, EINVAL);
}

}  // namespace dgramipc
