#pragma once

#include <string_view>

namespace canonurl {

// ASCII only: bytes outside [0, 127] (UTF-8 sequences, raw octets) are never classified as letters.

constexpr bool isupper(char ch) { return ch >= 'A' && ch <= 'Z'; }

// Tells whether 'str' contains at least one ASCII uppercase letter.
constexpr bool ContainsUpper(std::string_view str) {
  for (char ch : str) {
    if (isupper(ch)) {
      return true;
    }
  }
  return false;
}

}  // namespace canonurl
