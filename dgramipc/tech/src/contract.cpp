#include "dgramipc/contract.hpp"

#include <cstdlib>
#include <exception>
#include <string_view>

#include "dgramipc/log.hpp"

namespace dgramipc {

void ContractViolation(std::string_view expr, std::string_view msg, std::string_view file, int line) noexcept {
  try {
    log::critical("Contract violation at {}:{}: '{}' does not hold ({})", file, line, expr, msg);
    log::default_logger()->flush();
  } catch (const std::exception&) {
    // the process is going down anyway
  }
  std::abort();
}

}  // namespace dgramipc
