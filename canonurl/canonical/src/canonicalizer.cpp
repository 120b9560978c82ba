#include "canonurl/canonicalizer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "canonurl/canonical-decision.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/cctype.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/http-constants.hpp"
#include "canonurl/request-view.hpp"
#include "canonurl/tolower-str.hpp"

namespace canonurl {

namespace {

constexpr char kSlash = '/';

std::string_view TrimTrailingSlashes(std::string_view path) {
  const auto lastNonSlash = path.find_last_not_of(kSlash);
  return path.substr(0, lastNonSlash == std::string_view::npos ? 0 : lastNonSlash + 1U);
}

}  // namespace

CanonicalDecision EvaluateCanonicalUrl(const RequestView& request, const CanonicalizationOptions& options,
                                       Exemptions exemptions) {
  std::string_view path = request.path;
  const std::string_view queryString = request.queryString;

  CanonicalFixBmp fixes{};

  // The home page is a special case: with or without a trailing slash, it is considered the same by search engines.
  const bool hasPath = path.size() > 1U;
  if (hasPath) {
    const bool hasTrailingSlash = path.back() == kSlash;
    if (options.appendTrailingSlash) {
      if (!hasTrailingSlash && !exemptions.noTrailingSlashRule) {
        fixes = fixes | CanonicalFix::AppendTrailingSlash;
      }
    } else if (hasTrailingSlash) {
      path = TrimTrailingSlashes(path);
      fixes = fixes | CanonicalFix::StripTrailingSlash;
    }
  }

  if ((hasPath || !queryString.empty()) && options.lowercaseUrls && !exemptions.noTrailingSlashRule) {
    if (ContainsUpper(path)) {
      fixes = fixes | CanonicalFix::LowercasePath;
    }
    if (!exemptions.noLowercaseQueryStringRule && ContainsUpper(queryString)) {
      fixes = fixes | CanonicalFix::LowercaseQueryString;
    }
  }

  if (fixes == 0) {
    return CanonicalDecision::Canonical();
  }

  const bool absolute = !request.scheme.empty() && !request.host.empty();

  std::string url;
  url.reserve((absolute ? request.scheme.size() + http::SchemeSep.size() + request.host.size() : 0U) +
              request.pathBase.size() + path.size() + 1U + queryString.size());
  if (absolute) {
    url.append(request.scheme).append(http::SchemeSep).append(request.host);
  }
  url.append(request.pathBase);

  const std::size_t pathBeg = url.size();
  if (path.empty() && request.pathBase.empty()) {
    // all slashes were stripped, this is the root
    url.push_back(kSlash);
  } else {
    url.append(path);
  }
  if (IsFixSet(fixes, CanonicalFix::AppendTrailingSlash)) {
    url.push_back(kSlash);
  }
  if (IsFixSet(fixes, CanonicalFix::LowercasePath)) {
    tolower(url.data() + pathBeg, url.size() - pathBeg);
  }

  const std::size_t queryBeg = url.size();
  url.append(queryString);
  if (IsFixSet(fixes, CanonicalFix::LowercaseQueryString)) {
    tolower(url.data() + queryBeg, url.size() - queryBeg);
  }

  return CanonicalDecision::Redirect(std::move(url), pathBeg, queryBeg, fixes);
}

}  // namespace canonurl
