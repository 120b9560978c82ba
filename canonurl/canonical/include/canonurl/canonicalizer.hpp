#pragma once

#include "canonurl/canonical-decision.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/request-view.hpp"

namespace canonurl {

// Computes the canonical form of the URL of a GET request.
// The method of 'request' is not checked: callers are expected to only submit GET requests.
// All rules are cumulative and produce a single canonical URL:
//   1. Trailing slash (only for paths longer than one character):
//      - appendTrailingSlash : a missing '/' is appended, unless exemptions.noTrailingSlashRule is set.
//      - !appendTrailingSlash: all trailing '/' are stripped. exemptions are not looked at.
//   2. Lowercase (only if lowercaseUrls and if the path is longer than one character or a query string is present),
//      skipped entirely when exemptions.noTrailingSlashRule is set:
//      - the path is lowercased if it contains an uppercase character.
//      - the query string is lowercased if it contains an uppercase character,
//        unless exemptions.noLowercaseQueryStringRule is set.
// The canonical URL is rebuilt from the scheme, host and path base of the request.
// It is origin-relative if the request has no scheme or no host.
[[nodiscard]] CanonicalDecision EvaluateCanonicalUrl(const RequestView& request, const CanonicalizationOptions& options,
                                                     Exemptions exemptions);

class Canonicalizer {
 public:
  Canonicalizer() noexcept = default;

  explicit Canonicalizer(CanonicalizationOptions options) noexcept : _options(options) {}

  [[nodiscard]] CanonicalDecision evaluate(const RequestView& request, Exemptions exemptions = {}) const {
    return EvaluateCanonicalUrl(request, _options, exemptions);
  }

  [[nodiscard]] const CanonicalizationOptions& options() const noexcept { return _options; }

 private:
  CanonicalizationOptions _options;
};

}  // namespace canonurl
