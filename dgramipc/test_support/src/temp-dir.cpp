#include "dgramipc/temp-dir.hpp"

#include <unistd.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "dgramipc/log.hpp"

namespace dgramipc::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  static thread_local std::mt19937_64 engine = [] {
    // Collect multiple entropy sources and mix via seed_seq.
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    const auto pid = static_cast<uint64_t>(::getpid());
    std::array<uint64_t, 4> seeds{static_cast<uint64_t>(rd()), now, tid, pid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

// Socket paths are short-lived: prefer /tmp to a possibly long TMPDIR,
// a Unix socket address only holds a bit more than 100 bytes.
std::filesystem::path baseTempDir() {
  std::error_code ec;
  if (std::filesystem::is_directory("/tmp", ec)) {
    return "/tmp";
  }
  return std::filesystem::temp_directory_path();
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = baseTempDir();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::string ScopedTempDir::socketPath(std::string_view name) const { return (_dir / name).string(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir: unable to remove {}: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

}  // namespace dgramipc::test
