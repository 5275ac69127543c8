#pragma once

#include <sys/socket.h>
#include <sys/un.h>

#include <cstddef>
#include <string_view>

namespace dgramipc {

// Longest path a Unix-domain socket address can hold, the terminating NUL excluded
// (107 on Linux, 103 on macOS and the BSDs).
inline constexpr std::size_t kUnixSocketMaxPathLength = sizeof(sockaddr_un{}.sun_path) - 1U;

// Filesystem path encoded in a sockaddr_un.
// The stored path is always NUL-terminated inside sun_path so that it can be recovered
// as a C string (for unlink) at any time.
class UnixAddress {
 public:
  // Throws std::system_error(ENAMETOOLONG) if path is longer than kUnixSocketMaxPathLength.
  // Throws std::invalid_argument for an empty path (Linux would autobind an abstract address)
  // or an embedded NUL (the address would silently be truncated).
  explicit UnixAddress(std::string_view path);

  [[nodiscard]] const sockaddr* sockAddr() const noexcept { return reinterpret_cast<const sockaddr*>(&_addr); }

  [[nodiscard]] socklen_t sockLen() const noexcept { return _addrLen; }

  // The path, without its terminating NUL.
  [[nodiscard]] std::string_view path() const noexcept;

  // The path as a NUL-terminated C string, suitable for unlink().
  [[nodiscard]] const char* c_str() const noexcept { return _addr.sun_path; }

  bool operator==(const UnixAddress& other) const noexcept { return path() == other.path(); }

 private:
  sockaddr_un _addr{};
  socklen_t _addrLen{};
};

}  // namespace dgramipc
