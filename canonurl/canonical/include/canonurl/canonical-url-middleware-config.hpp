#pragma once

#include "canonurl/http-status-code.hpp"

namespace canonurl {

struct CanonicalUrlMiddlewareConfig {
  // Status code of the redirect response sent for non canonical URLs.
  // Only permanent redirects are allowed: 301 (Moved Permanently) or 308 (Permanent Redirect).
  // Default: 301
  http::StatusCode redirectStatusCode{http::StatusCodeMovedPermanently};

  CanonicalUrlMiddlewareConfig& withRedirectStatusCode(http::StatusCode statusCode);

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  bool operator==(const CanonicalUrlMiddlewareConfig&) const noexcept = default;
};

}  // namespace canonurl
