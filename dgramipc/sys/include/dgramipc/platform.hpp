#pragma once

// Platform detection, portable type aliases and error helpers for dgramipc's system layer.
//
// Detection macros:
//   DGRAMIPC_LINUX   : defined on Linux
//   DGRAMIPC_MACOS   : defined on macOS / Darwin
//   DGRAMIPC_BSD     : defined on FreeBSD / NetBSD / OpenBSD / DragonFly
//   DGRAMIPC_POSIX   : defined on every supported platform
//
// Unix-domain datagram sockets only exist on Unix-like systems, there is no Windows support.

#ifdef __linux__
#define DGRAMIPC_LINUX
#define DGRAMIPC_POSIX
#elifdef __APPLE__
#define DGRAMIPC_MACOS
#define DGRAMIPC_POSIX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
#define DGRAMIPC_BSD
#define DGRAMIPC_POSIX
#elif defined(__sun)
#define DGRAMIPC_POSIX
#else
#error "Unsupported platform, dgramipc requires Unix-domain datagram sockets (Linux, macOS, BSD, Solaris)"
#endif

#include <unistd.h>  // close

#include <cerrno>   // errno
#include <cstring>  // std::strerror

namespace dgramipc {

// The OS-level socket / file descriptor type.
using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

// Retrieve the last system/socket error code.
inline int LastSystemError() noexcept { return errno; }

// Human-readable description for an error code.
// The returned pointer is valid at least until the next call from the same thread.
// Always log the numeric code alongside the message.
inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

inline int CloseNativeHandle(NativeHandle fd) noexcept { return ::close(fd); }

namespace error {
inline constexpr int kInterrupted = EINTR;
inline constexpr int kNotFound = ENOENT;
inline constexpr int kNameTooLong = ENAMETOOLONG;
inline constexpr int kMessageTooBig = EMSGSIZE;
}  // namespace error

}  // namespace dgramipc
