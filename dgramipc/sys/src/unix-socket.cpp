#include "dgramipc/unix-socket.hpp"

#include <sys/socket.h>
#include <sys/uio.h>
#include <sys/un.h>

#include <cstddef>
#include <cstdint>
#include <span>

#include "dgramipc/base-fd.hpp"
#include "dgramipc/errno-throw.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/unix-address.hpp"

#ifndef DGRAMIPC_LINUX
#include "dgramipc/socket-ops.hpp"  // SetCloseOnExec, SetNoSigPipe
#endif

namespace dgramipc {

namespace {
constexpr int kSendFlags =
#ifdef DGRAMIPC_LINUX
    MSG_NOSIGNAL
#else
    // macOS / BSD: MSG_NOSIGNAL may not exist, SO_NOSIGPIPE is set on the socket instead.
    0
#endif
    ;
}  // namespace

UnixSocket::UnixSocket() {
#ifdef DGRAMIPC_LINUX
  _baseFd = BaseFd(::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0));
#else
  _baseFd = BaseFd(::socket(AF_UNIX, SOCK_DGRAM, 0));
#endif
  if (!_baseFd) {
    throw_errno("UnixSocket: socket creation failed");
  }
#ifndef DGRAMIPC_LINUX
  if (!SetCloseOnExec(_baseFd.fd()) || !SetNoSigPipe(_baseFd.fd())) {
    throw_errno("UnixSocket: fcntl failed");
  }
#endif
  log::debug("UnixSocket fd # {} opened", _baseFd.fd());
}

int UnixSocket::bind(const UnixAddress& address) const noexcept {
  return ::bind(_baseFd.fd(), address.sockAddr(), address.sockLen());
}

int64_t UnixSocket::sendTo(std::span<const std::byte> data, const UnixAddress& destination) const noexcept {
  return static_cast<int64_t>(
      ::sendto(_baseFd.fd(), data.data(), data.size(), kSendFlags, destination.sockAddr(), destination.sockLen()));
}

UnixSocket::RecvResult UnixSocket::recv(std::span<std::byte> dst) const noexcept {
  // recvmsg rather than recv: msg_flags is the portable way to learn about a truncated datagram.
  iovec iov{};
  iov.iov_base = dst.data();
  iov.iov_len = dst.size();

  msghdr msg{};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;

  const auto ret = ::recvmsg(_baseFd.fd(), &msg, 0);
  if (ret == -1) {
    return {-1, false};
  }
  return {static_cast<int64_t>(ret), (msg.msg_flags & MSG_TRUNC) != 0};
}

}  // namespace dgramipc
