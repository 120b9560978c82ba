#include "canonurl/exemption-registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "canonurl/exemptions.hpp"
#include "canonurl/string-equal-ignore-case.hpp"
#include "canonurl/tolower-str.hpp"

namespace canonurl {

namespace {

constexpr std::string_view kPrefixWildcard = "/*";

std::string_view TrimTrailingSlashes(std::string_view path) {
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

std::string LowerKey(std::string_view path) {
  std::string key(TrimTrailingSlashes(path));
  tolower(key);
  return key;
}

}  // namespace

ExemptionRegistry& ExemptionRegistry::add(std::string_view route, Exemptions exemptions) {
  if (route.empty() || route.front() != '/') {
    throw std::invalid_argument("ExemptionRegistry route must start with '/'");
  }
  if (route.contains('?')) {
    throw std::invalid_argument("ExemptionRegistry route must not contain a query string");
  }

  if (route.ends_with(kPrefixWildcard)) {
    std::string prefix = LowerKey(route.substr(0, route.size() - kPrefixWildcard.size()));
    const auto it = std::ranges::find(_prefixRoutes, prefix, &PrefixRoute::prefix);
    if (it == _prefixRoutes.end()) {
      _prefixRoutes.push_back(PrefixRoute{std::move(prefix), exemptions});
    } else {
      it->exemptions |= exemptions;
    }
  } else {
    _exactRoutes[LowerKey(route)] |= exemptions;
  }
  return *this;
}

Exemptions ExemptionRegistry::exemptionsFor(std::string_view path) const {
  Exemptions exemptions;
  if (empty()) {
    return exemptions;
  }

  path = TrimTrailingSlashes(path);

  for (const PrefixRoute& prefixRoute : _prefixRoutes) {
    const std::string_view prefix = prefixRoute.prefix;
    if (StartsWithCaseInsensitive(path, prefix) && (path.size() == prefix.size() || path[prefix.size()] == '/')) {
      exemptions |= prefixRoute.exemptions;
    }
  }

  if (!_exactRoutes.empty()) {
    const auto it = _exactRoutes.find(LowerKey(path));
    if (it != _exactRoutes.end()) {
      exemptions |= it->second;
    }
  }
  return exemptions;
}

}  // namespace canonurl
