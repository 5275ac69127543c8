#include "dgramipc/receiver.hpp"

#include <unistd.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "dgramipc/contract.hpp"
#include "dgramipc/errno-throw.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/message-buffer.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/poll-events.hpp"
#include "dgramipc/receiver-config.hpp"
#include "dgramipc/sender.hpp"
#include "dgramipc/socket-ops.hpp"
#include "dgramipc/unexpected-poll-event.hpp"
#include "dgramipc/unix-address.hpp"
#include "dgramipc/wait-policy.hpp"

namespace dgramipc {

namespace {

constexpr PollEventBmp kReadEvents = PollIn | PollHup | PollErr | PollNval;

// A previous run may have left its socket file behind: bind would fail with EADDRINUSE.
// unlink rather than std::filesystem::remove, a socket is not a regular file.
void RemoveStaleSocketFile(std::string_view path) {
  if (path.find('\0') != std::string_view::npos) {
    // unlink would stop at the NUL and remove another file.
    throw std::invalid_argument("Unix socket path contains an embedded NUL character");
  }
  const std::string pathStr(path);
  if (::unlink(pathStr.c_str()) != 0 && LastSystemError() != error::kNotFound) {
    throw_errno("Receiver: unable to remove existing file '{}'", path);
  }
}

Sender RemoveStaleSocketFileAndOpen(std::string_view path, LoggerPtr logger) {
  RemoveStaleSocketFile(path);
  return Sender(std::move(logger));
}

std::string ValidatedSocketPath(const ReceiverConfig& config) {
  ReceiverConfig validated = config;
  validated.validate();
  return std::string(validated.socketPath());
}

}  // namespace

Receiver::Receiver(std::string_view path, LoggerPtr logger)
    : _sender(RemoveStaleSocketFileAndOpen(path, std::move(logger))) {
  // Should any of these throw, _sender is destroyed (socket closed) before the exception leaves.
  UnixAddress boundAddress(path);
  if (_sender._socket.bind(boundAddress) != 0) {
    throw_errno("Receiver: unable to bind fd # {} to '{}'", _sender.fd(), path);
  }
  // There is no listen: datagram sockets have no connection phase.
  _address.emplace(boundAddress);
  _sender.logger()->debug("Receiver fd # {} bound to '{}'", _sender.fd(), path);
}

Receiver::Receiver(const ReceiverConfig& config) : Receiver(ValidatedSocketPath(config), config.logger()) {}

Receiver::Receiver(Receiver&& other) noexcept
    : _sender(std::move(other._sender)), _address(std::exchange(other._address, std::nullopt)) {}

Receiver& Receiver::operator=(Receiver&& other) noexcept {
  if (this != &other) {
    closeAndUnlink();
    _sender = std::move(other._sender);
    _address = std::exchange(other._address, std::nullopt);
  }
  return *this;
}

std::size_t Receiver::read(MessageBuffer& buffer, WaitPolicy waitPolicy) const {
  const auto [nbReady, revents] = PollOne(fd(), kReadEvents, waitPolicy.pollTimeoutMs());
  if (nbReady == -1) {
    throw_errno("Receiver: poll failed on fd # {}", fd());
  }
  DGRAMIPC_CHECK(nbReady <= 1, "poll reported more descriptors than polled");
  DGRAMIPC_CHECK((nbReady == 0) == (revents == 0), "poll ready count does not match its events");

  if (revents == 0) {
    // Nothing pending: timeout elapsed or non-blocking call.
    return 0;
  }

  if (revents == PollIn) {
    // Exactly one datagram is copied, never a part of it and never two.
    const auto [nbBytes, truncated] = _sender._socket.recv(buffer);
    if (nbBytes == -1) {
      throw_errno("Receiver: recv failed on fd # {}", fd());
    }
    if (truncated) {
      throw_error_code(error::kMessageTooBig, "Receiver: datagram on '{}' does not fit in {} bytes", path(),
                       buffer.size());
    }
    return static_cast<std::size_t>(nbBytes);
  }

  // Several flags can fire at once, they all end up in the same error.
  const auto& diag = logger();
  if ((revents & PollErr) != 0) {
    const int pendingErr = GetSocketError(fd());
    diag->error("Receiver '{}': POLLERR received (pending socket error {}: {})", path(), pendingErr,
                SystemErrorMessage(pendingErr));
  }
  if ((revents & PollHup) != 0) {
    diag->error("Receiver '{}': POLLHUP received", path());
  }
  if ((revents & PollNval) != 0) {
    diag->error("Receiver '{}': POLLNVAL received", path());
  }
  if ((revents & PollIn) != 0) {
    diag->error("Receiver '{}': POLLIN received together with an abnormal event", path());
  }
  throw UnexpectedPollEvent(revents);
}

void Receiver::closeAndUnlink() noexcept {
  if (!_address) {
    return;
  }
  const NativeHandle closedFd = fd();
  if (const int err = _sender.close(); err != 0) {
    logger()->error("Receiver: failed to close fd # {} of '{}': {} ({})", closedFd, _address->path(), err,
                    SystemErrorMessage(err));
  }

  // Cannot throw from a destructor: log and move on.
  if (::unlink(_address->c_str()) != 0) {
    const int err = LastSystemError();
    logger()->error("Receiver: failed to remove socket file '{}': {} ({})", _address->path(), err,
                    SystemErrorMessage(err));
  } else {
    logger()->debug("Receiver: socket file '{}' removed", _address->path());
  }
  _address.reset();
}

}  // namespace dgramipc
