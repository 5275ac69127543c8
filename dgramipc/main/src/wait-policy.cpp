#include "dgramipc/wait-policy.hpp"

#include <chrono>
#include <stdexcept>

#include "dgramipc/safe-cast.hpp"

namespace dgramipc {

WaitPolicy WaitPolicy::Timeout(std::chrono::milliseconds timeout) {
  if (timeout.count() < 0) {
    throw std::invalid_argument("WaitPolicy timeout cannot be negative");
  }
  return WaitPolicy(SafeCast<int>(timeout.count()));
}

}  // namespace dgramipc
