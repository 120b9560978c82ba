#pragma once

#include <cstdint>

namespace canonurl::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

}  // namespace canonurl::http
