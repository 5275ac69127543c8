// Two Receivers bouncing a counter back and forth.
// Usage: ping-pong [rounds] [socket-dir]
// Log level is read from SPDLOG_LEVEL, for instance SPDLOG_LEVEL=debug.
#include <spdlog/cfg/env.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <dgramipc/dgramipc.hpp>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace dgramipc;

namespace {

std::size_t WriteCounter(MessageBuffer &buf, uint32_t counter) {
  char *first = reinterpret_cast<char *>(buf.data());
  const auto res = std::to_chars(first, first + buf.size(), counter);
  return static_cast<std::size_t>(res.ptr - first);
}

uint32_t ReadCounter(const MessageBuffer &buf, std::size_t len) {
  uint32_t counter = 0;
  const char *first = reinterpret_cast<const char *>(buf.data());
  if (std::from_chars(first, first + len, counter).ec != std::errc{}) {
    throw std::runtime_error("received datagram is not a counter");
  }
  return counter;
}

}  // namespace

int main(int argc, char **argv) {
  spdlog::cfg::load_env_levels();

  uint32_t rounds = 10;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), rounds);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid number of rounds: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }
  const std::string dir = argc > 2 ? argv[2] : "/tmp";

  try {
    Receiver ping(dir + "/dgramipc-ping.sock");
    Receiver pong(dir + "/dgramipc-pong.sock");
    MessageBuffer buf{};

    ping.sendTo(std::span<const std::byte>(buf.data(), WriteCounter(buf, 0)), pong.address());
    for (uint32_t round = 0; round < rounds; ++round) {
      // Each side increments what it received and sends it back.
      for (const Receiver *self : {&pong, &ping}) {
        const Receiver &peer = self == &pong ? ping : pong;
        const std::size_t len = self->read(buf, WaitPolicy::Timeout(std::chrono::seconds{1}));
        if (len == 0) {
          log::error("'{}' received nothing in time", self->path());
          return EXIT_FAILURE;
        }
        const uint32_t counter = ReadCounter(buf, len) + 1U;
        log::info("'{}' got {}, answering {}", self->path(), counter - 1U, counter);
        self->sendTo(std::span<const std::byte>(buf.data(), WriteCounter(buf, counter)), peer.address());
      }
    }
    const std::size_t len = pong.read(buf, WaitPolicy::Timeout(std::chrono::seconds{1}));
    std::cout << "Final counter after " << rounds << " rounds: " << ReadCounter(buf, len) << '\n';
  } catch (const std::exception &e) {
    std::cerr << "ping-pong failed: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
