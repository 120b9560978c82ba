#pragma once

#include <string_view>

#include "canonurl/http-status-code.hpp"

namespace canonurl::http {

// HTTP header field names are case-insensitive per RFC 9110. They are stored here
// in their conventional canonical form for emission.
inline constexpr std::string_view Location = "Location";

inline constexpr std::string_view SchemeSep = "://";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view MovedPermanently = "Moved Permanently";    // 301
inline constexpr std::string_view PermanentRedirect = "Permanent Redirect";  // 308

// Return the canonical reason phrase for the subset of status codes we emit.
// If an unmapped status is provided, returns an empty string_view.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeMovedPermanently:
      return MovedPermanently;
    case StatusCodePermanentRedirect:
      return PermanentRedirect;
    default:
      return {};
  }
}

}  // namespace canonurl::http
