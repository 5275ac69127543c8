#pragma once

#include <cassert>
#include <cstring>
#include <string_view>

namespace dgramipc {

constexpr void Copy(std::string_view sv, char* dst) noexcept {
  // memcpy with a null pointer is undefined behavior even for a zero size.
  assert(dst != nullptr && (sv.data() != nullptr || sv.empty()));
  if (!sv.empty()) {
    std::memcpy(dst, sv.data(), sv.size());
  }
}

[[nodiscard]] constexpr char* Append(std::string_view sv, char* dst) noexcept {
  Copy(sv, dst);
  return dst + sv.size();
}

}  // namespace dgramipc
