#pragma once

#include <string_view>

#include "dgramipc/config.hpp"

namespace dgramipc {

// Logs the broken contract at critical level on the default logger, then aborts.
// Called only through DGRAMIPC_CHECK.
[[noreturn]] DGRAMIPC_NOINLINE void ContractViolation(std::string_view expr, std::string_view msg,
                                                      std::string_view file, int line) noexcept;

}  // namespace dgramipc

// Precondition / invariant check that stays enabled in release builds.
// A failure is a defect of the caller (or an impossible OS behavior), never an error to recover from.
#define DGRAMIPC_CHECK(cond, msg)                                             \
  do {                                                                        \
    if (DGRAMIPC_UNLIKELY(!(cond))) {                                         \
      ::dgramipc::ContractViolation(#cond, (msg), __FILE__, __LINE__);        \
    }                                                                         \
  } while (false)
