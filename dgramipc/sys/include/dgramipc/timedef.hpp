#pragma once

#include <chrono>

namespace dgramipc {

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace dgramipc
