#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "canonurl/exemptions.hpp"

namespace canonurl {

// Associates canonicalization exemptions to routes.
// Two kinds of routes are supported:
//   - exact routes, like "/api/export.csv"
//   - prefix routes, ending with "/*", like "/legacy/*". They apply to the prefix itself and to all paths below it.
// Route matching ignores ASCII case and trailing slashes, so that all the non canonical variants of a request path
// resolve to the same route. Exemptions of all matching routes are combined.
// The registry is meant to be filled at startup, it is safe to query it concurrently afterwards.
class ExemptionRegistry {
 public:
  // Registers exemptions for given route. Registering the same route several times combines the exemptions.
  // Throws std::invalid_argument if the route does not start with '/' or contains a query string.
  ExemptionRegistry& add(std::string_view route, Exemptions exemptions);

  // Returns the exemptions applying to given request path (empty if none).
  [[nodiscard]] Exemptions exemptionsFor(std::string_view path) const;

  [[nodiscard]] std::size_t size() const noexcept { return _exactRoutes.size() + _prefixRoutes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _exactRoutes.empty() && _prefixRoutes.empty(); }

 private:
  struct PrefixRoute {
    std::string prefix;
    Exemptions exemptions;
  };

  // keys are lowercase, without trailing slashes
  std::unordered_map<std::string, Exemptions> _exactRoutes;
  std::vector<PrefixRoute> _prefixRoutes;
};

}  // namespace canonurl
