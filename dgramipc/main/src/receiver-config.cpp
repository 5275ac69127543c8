#include "dgramipc/receiver-config.hpp"

#include <cstdlib>
#include <stdexcept>

#include "dgramipc/errno-throw.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/platform.hpp"
#include "dgramipc/unix-address.hpp"

namespace dgramipc {

void ReceiverConfig::validate() {
  if (_socketPath.empty()) {
    if (const char* env = std::getenv(kSocketPathEnvVar)) {
      withSocketPath(env);
    }
  }
  if (_socketPath.empty()) {
    throw std::invalid_argument("Receiver socket path is not configured");
  }
  if (_socketPath.size() > kUnixSocketMaxPathLength) {
    OrDefaultLogger(_logger)->critical("Receiver socket path '{}' has {} bytes, the maximum is {}", _socketPath,
                                       _socketPath.size(), kUnixSocketMaxPathLength);
    throw_error_code(error::kNameTooLong, "Receiver socket path of {} bytes exceeds the maximum of {}",
                     _socketPath.size(), kUnixSocketMaxPathLength);
  }
}

}  // namespace dgramipc
