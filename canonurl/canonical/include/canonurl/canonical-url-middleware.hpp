#pragma once

#include <functional>

#include "canonurl/canonical-url-middleware-config.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/canonicalizer.hpp"
#include "canonurl/exemption-registry.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/middleware.hpp"
#include "canonurl/request-view.hpp"

namespace canonurl {

// Request middleware redirecting GET requests with a non canonical URL to their canonical equivalent.
// Requests with any other method, and canonical GET requests, are let through (MiddlewareResult::Continue).
// Non canonical GET requests are short-circuited with a permanent redirect response whose Location header is set to
// the canonical URL. The embedding server must send it without invoking the route handler.
// It can be stored directly as a RequestMiddleware.
class CanonicalUrlMiddleware {
 public:
  // Resolves the exemptions of the endpoint targeted by a request.
  using ExemptionLookup = std::function<Exemptions(const RequestView&)>;

  // Throws std::invalid_argument if 'config' is invalid.
  explicit CanonicalUrlMiddleware(CanonicalizationOptions options, CanonicalUrlMiddlewareConfig config = {});

  // Exemptions are looked up in 'registry' from the request path.
  CanonicalUrlMiddleware(CanonicalizationOptions options, ExemptionRegistry registry,
                         CanonicalUrlMiddlewareConfig config = {});

  CanonicalUrlMiddleware(CanonicalizationOptions options, ExemptionLookup exemptionLookup,
                         CanonicalUrlMiddlewareConfig config = {});

  [[nodiscard]] MiddlewareResult operator()(const RequestView& request) const;

  [[nodiscard]] const Canonicalizer& canonicalizer() const noexcept { return _canonicalizer; }

  [[nodiscard]] const CanonicalUrlMiddlewareConfig& config() const noexcept { return _config; }

 private:
  Canonicalizer _canonicalizer;
  CanonicalUrlMiddlewareConfig _config;
  ExemptionLookup _exemptionLookup;
};

}  // namespace canonurl
