#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "dgramipc/log.hpp"

namespace dgramipc {

// Environment variable consulted by ReceiverConfig::validate when no socket path is configured.
inline constexpr const char kSocketPathEnvVar[] = "DGRAMIPC_SOCKET_PATH";

class ReceiverConfig {
 public:
  // Fills missing values from the environment, then checks the configuration.
  // Throws std::invalid_argument if the socket path is still empty,
  // std::system_error(ENAMETOOLONG) if it is too long for a Unix socket address.
  void validate();

  // Filesystem path the Receiver binds to. Empty => consult DGRAMIPC_SOCKET_PATH.
  [[nodiscard]] std::string_view socketPath() const noexcept { return _socketPath; }

  // Diagnostic sink of the Receiver. Null => default logger.
  [[nodiscard]] const LoggerPtr& logger() const noexcept { return _logger; }

  // Filesystem path the Receiver binds to. Empty => consult DGRAMIPC_SOCKET_PATH.
  ReceiverConfig& withSocketPath(std::string_view path) {
    _socketPath = path;
    return *this;
  }

  ReceiverConfig& withLogger(LoggerPtr logger) {
    _logger = std::move(logger);
    return *this;
  }

  bool operator==(const ReceiverConfig&) const noexcept = default;

 private:
  std::string _socketPath;
  LoggerPtr _logger;
};

}  // namespace dgramipc
