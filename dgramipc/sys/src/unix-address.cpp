#include "dgramipc/unix-address.hpp"

#include <sys/socket.h>
#include <sys/un.h>

#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string_view>

#include "dgramipc/contract.hpp"
#include "dgramipc/errno-throw.hpp"
#include "dgramipc/memory-utils.hpp"
#include "dgramipc/platform.hpp"

namespace dgramipc {

UnixAddress::UnixAddress(std::string_view path) {
  if (path.size() > kUnixSocketMaxPathLength) {
    throw_error_code(error::kNameTooLong, "Unix socket path of {} bytes exceeds the maximum of {}", path.size(),
                     kUnixSocketMaxPathLength);
  }
  if (path.empty()) {
    throw std::invalid_argument("Unix socket path is empty");
  }
  if (path.find('\0') != std::string_view::npos) {
    throw std::invalid_argument("Unix socket path contains an embedded NUL character");
  }
  _addr.sun_family = AF_UNIX;
  *Append(path, _addr.sun_path) = '\0';
  _addrLen = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1U);
}

std::string_view UnixAddress::path() const noexcept {
  const auto* end = static_cast<const char*>(std::memchr(_addr.sun_path, '\0', sizeof(_addr.sun_path)));
  DGRAMIPC_CHECK(end != nullptr, "stored Unix socket path must be NUL-terminated");
  return {_addr.sun_path, static_cast<std::size_t>(end - _addr.sun_path)};
}

}  // namespace dgramipc
