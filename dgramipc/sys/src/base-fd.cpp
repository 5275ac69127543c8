#include "dgramipc/base-fd.hpp"

#include <utility>

#include "dgramipc/log.hpp"
#include "dgramipc/platform.hpp"

namespace dgramipc {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    closeOrLog();
    _fd = other.release();
  }
  return *this;
}

int BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return 0;
  }
  int err = 0;
  while (CloseNativeHandle(_fd) != 0) {
    err = LastSystemError();
    if (err != error::kInterrupted) {
      // EBADF (benign if race closed elsewhere), EIO, etc.
      break;
    }
    // Retry close if interrupted; POSIX allows either retry or treat as closed.
    err = 0;
  }
  log::debug("fd # {} closed", _fd);
  _fd = kClosedFd;
  return err;
}

void BaseFd::closeOrLog() noexcept {
  const NativeHandle fd = _fd;
  if (const int err = close(); err != 0) {
    log::error("close fd # {} failed: {}", fd, SystemErrorMessage(err));
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace dgramipc
