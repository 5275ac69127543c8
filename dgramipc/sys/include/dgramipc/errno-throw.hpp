#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>
#include <utility>

namespace dgramipc {

// Throw std::system_error for an explicit error code with a formatted message.
template <typename... Args>
[[noreturn]] void throw_error_code(int err, std::format_string<Args...> fmt, Args&&... args) {
  throw std::system_error(std::error_code(err, std::generic_category()),
                          std::format(fmt, std::forward<Args>(args)...));
}

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for {}", path);
template <typename... Args>
[[noreturn]] void throw_errno(std::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  throw_error_code(savedErr, fmt, std::forward<Args>(args)...);
}

}  // namespace dgramipc
