#include "dgramipc/socket-ops.hpp"

#include <fcntl.h>
#include <sys/socket.h>

#include "dgramipc/platform.hpp"

namespace dgramipc {

bool SetCloseOnExec(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool SetNoSigPipe(NativeHandle fd) noexcept {
#ifdef DGRAMIPC_MACOS
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &kEnable, sizeof(kEnable)) == 0;
#else
  (void)fd;
  return true;
#endif
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return LastSystemError();
  }
  return err;
}

}  // namespace dgramipc
