#include "dgramipc/log.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

#include <memory>

namespace dgramipc {

TEST(LogTest, NullLoggerFallsBackToDefault) {
  EXPECT_EQ(OrDefaultLogger(nullptr), log::default_logger());
  EXPECT_EQ(OrDefaultLogger({}).get(), log::default_logger_raw());
}

TEST(LogTest, InjectedLoggerIsKept) {
  auto logger = std::make_shared<spdlog::logger>("injected", std::make_shared<spdlog::sinks::null_sink_mt>());
  EXPECT_EQ(OrDefaultLogger(logger), logger);
}

}  // namespace dgramipc
