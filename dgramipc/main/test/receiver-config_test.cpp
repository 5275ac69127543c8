#include "dgramipc/receiver-config.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "dgramipc/capture-logger.hpp"
#include "dgramipc/log.hpp"
#include "dgramipc/scoped-env-var.hpp"
#include "dgramipc/unix-address.hpp"

namespace dgramipc {

TEST(ReceiverConfigTest, DefaultIsEmpty) {
  ReceiverConfig config;
  EXPECT_TRUE(config.socketPath().empty());
  EXPECT_EQ(config.logger(), nullptr);
}

TEST(ReceiverConfigTest, ExplicitPathIsKept) {
  test::ScopedEnvVar env(kSocketPathEnvVar, "/tmp/from-env.sock");
  ReceiverConfig config;
  config.withSocketPath("/tmp/explicit.sock");
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.socketPath(), "/tmp/explicit.sock");
}

TEST(ReceiverConfigTest, MissingPathFallsBackToEnvironment) {
  test::ScopedEnvVar env(kSocketPathEnvVar, "/tmp/from-env.sock");
  ReceiverConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.socketPath(), "/tmp/from-env.sock");
}

TEST(ReceiverConfigTest, MissingPathWithoutEnvironmentThrows) {
  test::ScopedEnvVar env(kSocketPathEnvVar, nullptr);
  ReceiverConfig config;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ReceiverConfigTest, EmptyEnvironmentValueThrows) {
  test::ScopedEnvVar env(kSocketPathEnvVar, "");
  ReceiverConfig config;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ReceiverConfigTest, TooLongPathThrowsNameTooLong) {
  test::CaptureLogger capture;
  ReceiverConfig config;
  config.withSocketPath("/tmp/" + std::string(kUnixSocketMaxPathLength, 'p')).withLogger(capture.logger());
  try {
    config.validate();
    FAIL() << "Expected std::system_error to be thrown";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENAMETOOLONG);
  }
  // Reported on the configured logger, not the default one.
  EXPECT_TRUE(capture.contains("the maximum is " + std::to_string(kUnixSocketMaxPathLength)));

  config.withSocketPath("/tmp/" + std::string(kUnixSocketMaxPathLength - 5U, 'p'));
  EXPECT_NO_THROW(config.validate());
}

TEST(ReceiverConfigTest, LoggerAndEquality) {
  auto logger = std::make_shared<spdlog::logger>("cfg", std::make_shared<spdlog::sinks::null_sink_mt>());
  ReceiverConfig lhs;
  lhs.withSocketPath("/tmp/a.sock").withLogger(logger);
  EXPECT_EQ(lhs.logger(), logger);

  ReceiverConfig rhs;
  rhs.withSocketPath("/tmp/a.sock");
  EXPECT_NE(lhs, rhs);
  rhs.withLogger(logger);
  EXPECT_EQ(lhs, rhs);
}

}  // namespace dgramipc
