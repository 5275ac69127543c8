#pragma once

#include "dgramipc/platform.hpp"

namespace dgramipc {

// Simple RAII class wrapping a socket file descriptor.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  explicit BaseFd(NativeHandle fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  // A close failure at destruction is logged on the default logger.
  ~BaseFd() { closeOrLog(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  // Truthy check so users can write: if (baseFd) { ... }
  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  // Returns the raw fd and sets this object to closed state.
  [[nodiscard]] NativeHandle release() noexcept;

  // Close the underlying file descriptor immediately.
  // Typically you should rely on RAII (destructor) except when you need to:
  //  * release the socket before removing its backing file (Receiver destruction)
  //  * observe/force close errors deterministically at a specific point
  // Idempotent: multiple calls after first successful/failed close are no-ops.
  // Returns 0, or the errno of a failed close. The descriptor is released in both cases.
  int close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  void closeOrLog() noexcept;

  NativeHandle _fd;
};

}  // namespace dgramipc
