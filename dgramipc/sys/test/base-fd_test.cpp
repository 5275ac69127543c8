#include "dgramipc/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#define DGRAMIPC_WANT_SOCKET_OVERRIDES

#include "dgramipc/capture-logger.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/sys-test-support.hpp"

using namespace dgramipc;

namespace {

int NewDatagramFd() { return ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0); }

int CallRealClose(int fd) { return test::ResolveRealClose()(fd); }

// Routes the default logger to a capture logger for the lifetime of the object.
class DefaultLoggerSwap {
 public:
  explicit DefaultLoggerSwap(LoggerPtr logger) : _previous(log::default_logger()) {
    log::set_default_logger(std::move(logger));
  }
  DefaultLoggerSwap(const DefaultLoggerSwap&) = delete;
  DefaultLoggerSwap& operator=(const DefaultLoggerSwap&) = delete;
  ~DefaultLoggerSwap() { log::set_default_logger(_previous); }

 private:
  LoggerPtr _previous;
};

}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd empty;
  EXPECT_FALSE(empty);
  EXPECT_EQ(empty.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ReleaseMakesObjectClosedAndReturnsFd) {
  const int fd = NewDatagramFd();
  ASSERT_GE(fd, 0);
  BaseFd owner(fd);

  ASSERT_TRUE(owner);
  const int raw = owner.release();
  EXPECT_FALSE(owner);
  EXPECT_EQ(raw, fd);
  EXPECT_EQ(0, ::close(raw));
}

TEST(BaseFd, ReleaseOnClosedReturnsClosedSentinel) {
  BaseFd empty;
  const int rv = empty.release();
  EXPECT_EQ(rv, BaseFd::kClosedFd);
}

TEST(BaseFd, CloseIsIdempotent) {
  BaseFd owner(NewDatagramFd());
  ASSERT_TRUE(owner);
  owner.close();
  EXPECT_FALSE(owner);
  owner.close();
  EXPECT_FALSE(owner);
}

TEST(BaseFd, MoveConstructTransfersOwnership) {
  const int fd = NewDatagramFd();
  ASSERT_GE(fd, 0);
  BaseFd first(fd);
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), fd);
}

TEST(BaseFd, MoveAssignClosesPreviousFd) {
  const int fd1 = NewDatagramFd();
  const int fd2 = NewDatagramFd();
  ASSERT_GE(fd1, 0);
  ASSERT_GE(fd2, 0);
  BaseFd first(fd1);
  BaseFd second(fd2);
  second = std::move(first);
  EXPECT_EQ(second.fd(), fd1);
  // fd2 has been closed by the move assignment
  EXPECT_EQ(-1, ::fcntl(fd2, F_GETFD));
  EXPECT_EQ(EBADF, errno);
}

TEST(BaseFd, MoveAssignSelfNoOpLeavesFdIntact) {
  BaseFd owner(NewDatagramFd());
  ASSERT_TRUE(owner);
  auto& alias = owner;
  owner = std::move(alias);
  EXPECT_TRUE(owner);
  owner.close();
}

#ifdef SYS_memfd_create
TEST(BaseFd, DestroyShouldLogIfFdAlreadyClosed) {
  const int fd = test::CreateMemfd("dgramipc-memfd-double-close");
  ASSERT_GE(fd, 0);

  BaseFd owner(fd);

  ::close(fd);  // close before destruction to simulate double-close
}
#endif

TEST(BaseFd, CloseRetriesAfterEintr) {
  test::SocketActionsGuard guard;
  const int fd = NewDatagramFd();
  ASSERT_GE(fd, 0);

  test::PushCloseAction(fd, {-1, EINTR});

  BaseFd owner(fd);
  EXPECT_EQ(owner.close(), 0);
  EXPECT_FALSE(owner);
  // The retry really closed it.
  EXPECT_EQ(-1, ::fcntl(fd, F_GETFD));
}

TEST(BaseFd, CloseReportsOtherErrorsButMarksClosed) {
  test::SocketActionsGuard guard;
  const int fd = NewDatagramFd();
  ASSERT_GE(fd, 0);

  test::PushCloseAction(fd, {-1, EIO});

  BaseFd owner(fd);
  EXPECT_EQ(owner.close(), EIO);
  EXPECT_FALSE(owner);
  EXPECT_EQ(owner.close(), 0);

  ASSERT_EQ(0, CallRealClose(fd));
}

TEST(BaseFd, DestructorLogsCloseFailureOnDefaultLogger) {
  test::SocketActionsGuard guard;
  test::CaptureLogger capture;
  const int fd = NewDatagramFd();
  ASSERT_GE(fd, 0);

  {
    DefaultLoggerSwap swap(capture.logger());
    test::PushCloseAction(fd, {-1, EIO});
    BaseFd owner(fd);
  }
  EXPECT_TRUE(capture.contains("close fd # " + std::to_string(fd) + " failed"));

  ASSERT_EQ(0, CallRealClose(fd));
}
