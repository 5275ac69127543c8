#pragma once

// Logging facade over spdlog.
// Ensure header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition (avoids redefinition warnings if consumers also
// decide to force header-only or use the compiled lib variant).
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>
#include <utility>

namespace dgramipc {

namespace log = spdlog;

// Diagnostic sink handed to the endpoints. A null pointer means the process default logger.
using LoggerPtr = std::shared_ptr<spdlog::logger>;

[[nodiscard]] inline LoggerPtr OrDefaultLogger(LoggerPtr logger) {
  if (logger) {
    return logger;
  }
  return spdlog::default_logger();
}

}  // namespace dgramipc
