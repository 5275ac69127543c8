#pragma once

#include <array>
#include <cstddef>

namespace dgramipc {

// Largest datagram every supported platform accepts on a Unix-domain socket without tuning.
inline constexpr std::size_t kMessageBufferSize = 2048;

// Caller-owned unit of every send and receive. Never grows.
using MessageBuffer = std::array<std::byte, kMessageBufferSize>;

}  // namespace dgramipc
