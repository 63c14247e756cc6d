#pragma once

#include <algorithm>
#include <string_view>

namespace solohttp {

// ASCII only case folding: bytes outside [A-Z] are left untouched. See utf8-tolower.hpp for UTF-8 text.

constexpr char ToLowerAscii(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch + ('a' - 'A'));
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](char lhsCh, char rhsCh) { return ToLowerAscii(lhsCh) == ToLowerAscii(rhsCh); });
}

}  // namespace solohttp
