#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dgramipc::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (with everything inside) on destruction.
// Socket files of a test are created inside it so that a failing test leaves nothing behind.
class ScopedTempDir {
 public:
  // Create a uniquely-named temporary directory with optional prefix.
  explicit ScopedTempDir(std::string_view prefix = "dgramipc-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Path of `name` inside the directory, as a string ready for a Unix socket address.
  [[nodiscard]] std::string socketPath(std::string_view name) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace dgramipc::test
