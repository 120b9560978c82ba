#include "canonurl/canonical-url-middleware.hpp"

#include <utility>

#include "canonurl/canonical-decision.hpp"
#include "canonurl/canonical-url-middleware-config.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/exemption-registry.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/http-response.hpp"
#include "canonurl/log.hpp"
#include "canonurl/middleware.hpp"
#include "canonurl/request-view.hpp"

namespace canonurl {

CanonicalUrlMiddleware::CanonicalUrlMiddleware(CanonicalizationOptions options, CanonicalUrlMiddlewareConfig config)
    : CanonicalUrlMiddleware(options, ExemptionLookup{}, config) {}

CanonicalUrlMiddleware::CanonicalUrlMiddleware(CanonicalizationOptions options, ExemptionRegistry registry,
                                               CanonicalUrlMiddlewareConfig config)
    : CanonicalUrlMiddleware(options,
                             ExemptionLookup{[registry = std::move(registry)](const RequestView& request) {
                               return registry.exemptionsFor(request.path);
                             }},
                             config) {}

CanonicalUrlMiddleware::CanonicalUrlMiddleware(CanonicalizationOptions options, ExemptionLookup exemptionLookup,
                                               CanonicalUrlMiddlewareConfig config)
    : _canonicalizer(options), _config(config), _exemptionLookup(std::move(exemptionLookup)) {
  _config.validate();
}

MiddlewareResult CanonicalUrlMiddleware::operator()(const RequestView& request) const {
  if (!request.isGet()) {
    return MiddlewareResult::Continue();
  }

  const Exemptions exemptions = _exemptionLookup ? _exemptionLookup(request) : Exemptions{};

  const CanonicalDecision decision = _canonicalizer.evaluate(request, exemptions);
  if (decision.isCanonical()) {
    return MiddlewareResult::Continue();
  }

  log::debug("Redirecting non canonical URL '{}{}' to '{}' with status {}", request.path, request.queryString,
             decision.canonicalUrl(), _config.redirectStatusCode);

  return MiddlewareResult::ShortCircuit(HttpResponse(_config.redirectStatusCode).location(decision.canonicalUrl()));
}

}  // namespace canonurl
