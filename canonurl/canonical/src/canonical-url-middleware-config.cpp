#include "canonurl/canonical-url-middleware-config.hpp"

#include <stdexcept>

#include "canonurl/http-status-code.hpp"

namespace canonurl {

CanonicalUrlMiddlewareConfig& CanonicalUrlMiddlewareConfig::withRedirectStatusCode(http::StatusCode statusCode) {
  redirectStatusCode = statusCode;
  return *this;
}

void CanonicalUrlMiddlewareConfig::validate() const {
  if (redirectStatusCode != http::StatusCodeMovedPermanently && redirectStatusCode != http::StatusCodePermanentRedirect) {
    throw std::invalid_argument("CanonicalUrlMiddlewareConfig.redirectStatusCode must be 301 or 308");
  }
}

}  // namespace canonurl
