#pragma once

namespace canonurl {

// Per-route overrides suppressing specific canonicalization rules.
// They are resolved by the caller from route metadata (see ExemptionRegistry) and passed to the canonicalizer.
struct Exemptions {
  constexpr Exemptions& operator|=(Exemptions other) noexcept {
    noTrailingSlashRule |= other.noTrailingSlashRule;
    noLowercaseQueryStringRule |= other.noLowercaseQueryStringRule;
    return *this;
  }

  [[nodiscard]] constexpr bool any() const noexcept { return noTrailingSlashRule || noLowercaseQueryStringRule; }

  bool operator==(const Exemptions&) const noexcept = default;

  // Suppresses the trailing slash append rule.
  // Note that it also suppresses path and query string lowercasing, but not the trailing slash strip rule.
  bool noTrailingSlashRule{false};

  // Suppresses query string lowercasing only.
  bool noLowercaseQueryStringRule{false};
};

constexpr Exemptions operator|(Exemptions lhs, Exemptions rhs) noexcept { return lhs |= rhs; }

inline constexpr Exemptions kNoTrailingSlashRule{.noTrailingSlashRule = true};
inline constexpr Exemptions kNoLowercaseQueryStringRule{.noLowercaseQueryStringRule = true};

}  // namespace canonurl
