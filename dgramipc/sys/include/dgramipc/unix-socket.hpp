#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "dgramipc/base-fd.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/unix-address.hpp"

namespace dgramipc {

// RAII wrapper for a blocking, close-on-exec AF_UNIX datagram socket
// (SOCK_CLOEXEC at creation on Linux, fcntl elsewhere).
class UnixSocket {
 public:
  struct RecvResult {
    // Bytes copied into the destination, or -1 on error (errno is set).
    int64_t nbBytes;
    // The datagram was larger than the destination and its tail was discarded.
    bool truncated;
  };

  // Create the socket. Throws std::system_error on failure.
  // The socket is closed only after close() or once moved from.
  UnixSocket();

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind the socket to `address`. This creates the socket file.
  // Returns 0 on success, -1 on error (errno is set).
  int bind(const UnixAddress& address) const noexcept;

  // Send one datagram to `destination`, with SIGPIPE suppressed.
  // Returns the number of bytes sent, or -1 on error (errno is set).
  int64_t sendTo(std::span<const std::byte> data, const UnixAddress& destination) const noexcept;

  // Receive at most one datagram into `dst`. Blocks while nothing is pending, poll first to avoid it.
  [[nodiscard]] RecvResult recv(std::span<std::byte> dst) const noexcept;

  // Returns 0, or the errno of a failed close.
  int close() noexcept { return _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace dgramipc
