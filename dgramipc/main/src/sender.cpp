#include "dgramipc/sender.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "dgramipc/contract.hpp"
#include "dgramipc/errno-throw.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/message-buffer.hpp"
#include "dgramipc/unix-address.hpp"
#include "dgramipc/unix-socket.hpp"

namespace dgramipc {

Sender::Sender(LoggerPtr logger) : _logger(OrDefaultLogger(std::move(logger))) {
  _logger->debug("Sender fd # {} opened", _socket.fd());
}

std::size_t Sender::sendTo(std::span<const std::byte> buffer, const UnixAddress& destination) const {
  DGRAMIPC_CHECK(buffer.size() <= kMessageBufferSize, "a datagram cannot exceed the message buffer size");

  const int64_t sentBytes = _socket.sendTo(buffer, destination);
  if (sentBytes == -1) {
    throw_errno("Sender: unable to send {} bytes to '{}'", buffer.size(), destination.path());
  }

  // Datagram sends are all or nothing.
  DGRAMIPC_CHECK(static_cast<std::size_t>(sentBytes) == buffer.size(), "partial datagram send");

  _logger->trace("Sender fd # {} sent {} bytes to '{}'", _socket.fd(), sentBytes, destination.path());
  return static_cast<std::size_t>(sentBytes);
}

}  // namespace dgramipc
