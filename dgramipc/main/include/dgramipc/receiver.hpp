#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "dgramipc/log.hpp"
#include "dgramipc/message-buffer.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/sender.hpp"
#include "dgramipc/unix-address.hpp"
#include "dgramipc/wait-policy.hpp"

namespace dgramipc {

class ReceiverConfig;

// Unix-domain datagram socket bound to a filesystem path: it receives, and it can send too.
//
// Lifecycle:
//  * construction removes a stale file left at the path by a previous run, opens the socket
//    and binds it, which creates the socket file.
//  * destruction closes the socket then removes the socket file. A removal failure is logged
//    on the injected logger, never thrown.
// Two live Receivers must never use the same path.
class Receiver {
 public:
  // Bind a new Receiver to `path`.
  // Throws std::system_error when:
  //  - an existing file at path cannot be removed (anything else than ENOENT)
  //  - the socket cannot be created
  //  - path is longer than kUnixSocketMaxPathLength (ENAMETOOLONG)
  //  - bind fails (EACCES, ENOENT for a missing directory, EADDRINUSE...)
  // logger receives the diagnostics of this Receiver. Null means the default logger.
  explicit Receiver(std::string_view path, LoggerPtr logger = {});

  // Bind a new Receiver from a configuration. The configuration is validated first.
  explicit Receiver(const ReceiverConfig& config);

  Receiver(const Receiver&) = delete;
  Receiver(Receiver&& other) noexcept;
  Receiver& operator=(const Receiver&) = delete;
  Receiver& operator=(Receiver&& other) noexcept;

  ~Receiver() { closeAndUnlink(); }

  // Wait for a datagram according to waitPolicy, then copy it into buffer.
  // Returns:
  //  - 0 if nothing arrived (non-blocking call with nothing pending, or timeout elapsed).
  //    This is not an end of stream.
  //  - the size of the received datagram otherwise (a datagram may legitimately be empty).
  // Throws:
  //  - UnexpectedPollEvent if poll reports anything else than exactly POLLIN.
  //  - std::system_error(EMSGSIZE) if the pending datagram is larger than the buffer. It is consumed.
  //  - std::system_error for poll or receive failures.
  std::size_t read(MessageBuffer& buffer, WaitPolicy waitPolicy) const;

  // A bound socket can send as well, for instance to reply to another Receiver.
  std::size_t sendTo(std::span<const std::byte> buffer, const UnixAddress& destination) const {
    return _sender.sendTo(buffer, destination);
  }

  std::size_t sendTo(std::span<const std::byte> buffer, std::string_view destinationPath) const {
    return _sender.sendTo(buffer, destinationPath);
  }

  // Address this Receiver is bound to.
  [[nodiscard]] const UnixAddress& address() const noexcept { return *_address; }

  [[nodiscard]] std::string_view path() const noexcept { return _address->path(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _sender.fd(); }

  [[nodiscard]] const LoggerPtr& logger() const noexcept { return _sender.logger(); }

 private:
  void closeAndUnlink() noexcept;

  Sender _sender;
  // Empty only for a moved-from Receiver.
  std::optional<UnixAddress> _address;
};

}  // namespace dgramipc
