#pragma once

#include "dgramipc/platform.hpp"

namespace dgramipc {

// Thin wrappers centralising descriptor option syscalls, so that higher-level
// modules never include platform networking headers directly.

// Set the close-on-exec flag on a file descriptor.
// Returns true on success.
bool SetCloseOnExec(NativeHandle fd) noexcept;

// Suppress SIGPIPE on a socket (macOS: SO_NOSIGPIPE).
// No-op elsewhere (Linux uses MSG_NOSIGNAL per-send).
// Returns true on success.
bool SetNoSigPipe(NativeHandle fd) noexcept;

// Retrieve and clear the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
// On failure to query, returns the errno from getsockopt itself.
int GetSocketError(NativeHandle fd) noexcept;

}  // namespace dgramipc
