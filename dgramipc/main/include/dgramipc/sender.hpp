#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "dgramipc/log.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/unix-address.hpp"
#include "dgramipc/unix-socket.hpp"

namespace dgramipc {

// Unix-domain datagram socket that can only send.
// Usage:
//   Sender sender;
//   MessageBuffer buf{};
//   sender.sendTo(buf, "/run/myapp/receiver.sock");
// Notes:
//  - The socket is blocking and close-on-exec. It is never bound, so nobody can reply to it.
//  - Nothing is retried: each failed send is reported to the caller as std::system_error.
//  - Not thread-safe, share a Sender across threads only with external synchronization.
class Sender {
 public:
  // Create the datagram socket. Throws std::system_error if the OS refuses
  // (EMFILE, ENFILE, EACCES, EAFNOSUPPORT...).
  // logger receives the diagnostics of this Sender. Null means the default logger.
  explicit Sender(LoggerPtr logger = {});

  Sender(const Sender&) = delete;
  Sender(Sender&&) noexcept = default;
  Sender& operator=(const Sender&) = delete;
  Sender& operator=(Sender&&) noexcept = default;

  ~Sender() = default;

  // Send `buffer` as a single datagram to `destination`.
  // Precondition: buffer.size() <= kMessageBufferSize (aborts otherwise).
  // Returns buffer.size(). Throws std::system_error on failure, for instance ENOENT when nothing
  // exists at the destination path or ECONNREFUSED when no socket is bound to it anymore.
  std::size_t sendTo(std::span<const std::byte> buffer, const UnixAddress& destination) const;

  // Same as above, building the destination address from a path first (may throw ENAMETOOLONG).
  std::size_t sendTo(std::span<const std::byte> buffer, std::string_view destinationPath) const {
    return sendTo(buffer, UnixAddress(destinationPath));
  }

  [[nodiscard]] NativeHandle fd() const noexcept { return _socket.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_socket); }

  [[nodiscard]] const LoggerPtr& logger() const noexcept { return _logger; }

 private:
  friend class Receiver;

  // Release the socket before the Receiver removes its file.
  // Returns 0, or the errno of a failed close.
  int close() noexcept { return _socket.close(); }

  LoggerPtr _logger;
  UnixSocket _socket;
};

}  // namespace dgramipc
