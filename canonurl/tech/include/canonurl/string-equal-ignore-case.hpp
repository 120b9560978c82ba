#pragma once

#include <string_view>

#include "canonurl/toupperlower.hpp"

namespace canonurl {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }

  const char* pVal = value.data();
  const char* pPre = prefix.data();
  const char* end = pPre + prefix.size();

  for (; pPre != end; ++pVal, ++pPre) {
    if (tolower(*pVal) != tolower(*pPre)) {
      return false;
    }
  }
  return true;
}

}  // namespace canonurl
