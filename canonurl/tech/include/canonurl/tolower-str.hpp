#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "canonurl/toupperlower.hpp"

#if defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
#include <emmintrin.h>
#endif

namespace canonurl {

// Lowercases the 8 ASCII bytes packed in 'val'. Non ASCII letters are kept as is.
constexpr uint64_t AsciiLowerMask(uint64_t val) {
  auto BytewiseLower = [](uint64_t input) {
    uint64_t result = 0;
    for (std::size_t bytePos = 0; bytePos < sizeof(uint64_t); ++bytePos) {
      const auto shift = static_cast<unsigned>(bytePos * 8);
      const auto byteVal = static_cast<unsigned char>(input >> shift);
      result |= static_cast<uint64_t>(tolower(byteVal)) << shift;
    }
    return result;
  };

  if consteval {
    return BytewiseLower(val);
  }

#if defined(__SSE2__) || defined(_M_X64) || defined(_M_AMD64)
  const auto input = _mm_cvtsi64_si128(static_cast<long long>(val));
  const auto aMinus1 = _mm_set1_epi8(static_cast<char>('A' - 1));
  const auto zPlus1 = _mm_set1_epi8(static_cast<char>('Z' + 1));
  const auto geA = _mm_cmpgt_epi8(input, aMinus1);
  const auto ltZ = _mm_cmpgt_epi8(zPlus1, input);
  const auto isUpper = _mm_and_si128(geA, ltZ);
  const auto lowerBit = _mm_and_si128(isUpper, _mm_set1_epi8(0x20));
  const auto lowered = _mm_or_si128(input, lowerBit);
  return static_cast<uint64_t>(_mm_cvtsi128_si64(lowered));
#else
  return BytewiseLower(val);
#endif
}

// Inplace tolower for ASCII characters, 8 bytes at a time.
// buf should be at least of size 'len'.
constexpr void tolower(char* buf, std::size_t len) {
  std::size_t pos = 0;

  if !consteval {
    for (; pos + sizeof(uint64_t) <= len; pos += sizeof(uint64_t)) {
      uint64_t word;
      std::memcpy(&word, buf + pos, sizeof(uint64_t));
      word = AsciiLowerMask(word);
      std::memcpy(buf + pos, &word, sizeof(uint64_t));
    }
  }

  // tail
  for (; pos < len; ++pos) {
    buf[pos] = tolower(buf[pos]);
  }
}

inline void tolower(std::string& str) { tolower(str.data(), str.size()); }

}  // namespace canonurl
