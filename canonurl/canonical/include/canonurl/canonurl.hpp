// canonurl Umbrella Header
//
// Include this single header to pull in the public API:
//   - Core decision (EvaluateCanonicalUrl, Canonicalizer, CanonicalDecision)
//   - Configuration types (CanonicalizationOptions, CanonicalUrlMiddlewareConfig)
//   - Per route exemptions (Exemptions, ExemptionRegistry)
//   - Server integration (CanonicalUrlMiddleware, MiddlewareResult, RequestView, HttpResponse)
//
// Each re-exported header line is annotated with IWYU pragma: export so that symbols they provide
// are treated as satisfied for direct use in user code.
//
// Usage Example:
//    #include <canonurl/canonurl.hpp>
//    using namespace canonurl;
//    CanonicalUrlMiddleware middleware(CanonicalizationOptions{}.withAppendTrailingSlash().withLowercaseUrls());
//    auto result = middleware(RequestView::Parse("GET", "https", "example.com", "/About"));
//    if (result.shouldShortCircuit()) {
//      // send std::move(result).takeResponse(): 301 with "Location: https://example.com/about/"
//    }
#pragma once

// IWYU pragma: begin_exports
#include "canonurl/canonical-decision.hpp"
#include "canonurl/canonical-url-middleware-config.hpp"
#include "canonurl/canonical-url-middleware.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/canonicalizer.hpp"
#include "canonurl/exemption-registry.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/http-constants.hpp"
#include "canonurl/http-method.hpp"
#include "canonurl/http-response.hpp"
#include "canonurl/http-status-code.hpp"
#include "canonurl/middleware.hpp"
#include "canonurl/request-view.hpp"
// IWYU pragma: end_exports
