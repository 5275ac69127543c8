#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dgramipc/log.hpp"

namespace dgramipc::test {

// Logger keeping its last formatted lines in memory, to inject into an endpoint
// and check what it reported.
class CaptureLogger {
 public:
  explicit CaptureLogger(std::size_t capacity = 64)
      : _sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity)),
        _logger(std::make_shared<spdlog::logger>("capture", _sink)) {
    _logger->set_level(log::level::trace);
  }

  [[nodiscard]] const LoggerPtr& logger() const noexcept { return _logger; }

  [[nodiscard]] std::vector<std::string> lines() const { return _sink->last_formatted(); }

  [[nodiscard]] bool contains(std::string_view needle) const {
    const auto all = lines();
    return std::ranges::any_of(all, [needle](const std::string& line) { return line.contains(needle); });
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _sink;
  LoggerPtr _logger;
};

}  // namespace dgramipc::test
