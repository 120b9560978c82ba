#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace canonurl {

// Rules that may fire on a non canonical URL. Several of them can be combined in a single decision.
enum class CanonicalFix : uint8_t {
  AppendTrailingSlash = 1 << 0,
  StripTrailingSlash = 1 << 1,
  LowercasePath = 1 << 2,
  LowercaseQueryString = 1 << 3
};

using CanonicalFixBmp = uint8_t;

constexpr CanonicalFixBmp operator|(CanonicalFixBmp lhs, CanonicalFix rhs) noexcept {
  return static_cast<CanonicalFixBmp>(lhs | static_cast<CanonicalFixBmp>(rhs));
}

constexpr CanonicalFixBmp operator|(CanonicalFix lhs, CanonicalFix rhs) noexcept {
  return static_cast<CanonicalFixBmp>(lhs) | rhs;
}

constexpr bool IsFixSet(CanonicalFixBmp fixes, CanonicalFix fix) noexcept {
  return (fixes & static_cast<CanonicalFixBmp>(fix)) != 0U;
}

// Outcome of the canonicalization of a request URL: either Canonical (nothing to do),
// or Redirect with the full canonical URL.
// The canonical URL is stored in a single buffer, layout being:
//   [scheme "://" host][pathBase][path][queryString]
//                                ^     ^
//                          _pathBeg   _queryBeg
class CanonicalDecision {
 public:
  // Synonym of CanonicalDecision::Canonical.
  CanonicalDecision() noexcept = default;

  static CanonicalDecision Canonical() noexcept { return {}; }

  // 'fixes' must not be empty, and the offsets must satisfy pathBeg <= queryBeg <= canonicalUrl.size().
  static CanonicalDecision Redirect(std::string canonicalUrl, std::size_t pathBeg, std::size_t queryBeg,
                                    CanonicalFixBmp fixes) noexcept {
    return {std::move(canonicalUrl), pathBeg, queryBeg, fixes};
  }

  [[nodiscard]] bool isCanonical() const noexcept { return _fixes == 0; }

  [[nodiscard]] bool isRedirect() const noexcept { return _fixes != 0; }

  // The URL to redirect to. Empty if canonical.
  [[nodiscard]] std::string_view canonicalUrl() const noexcept { return _canonicalUrl; }

  // The canonical path (without path base). Empty if canonical.
  [[nodiscard]] std::string_view path() const noexcept {
    return std::string_view(_canonicalUrl).substr(_pathBeg, _queryBeg - _pathBeg);
  }

  // The canonical query string, with its leading '?' if not empty.
  [[nodiscard]] std::string_view queryString() const noexcept {
    return std::string_view(_canonicalUrl).substr(_queryBeg);
  }

  [[nodiscard]] CanonicalFixBmp fixes() const noexcept { return _fixes; }

  [[nodiscard]] bool hasFix(CanonicalFix fix) const noexcept { return IsFixSet(_fixes, fix); }

 private:
  CanonicalDecision(std::string canonicalUrl, std::size_t pathBeg, std::size_t queryBeg, CanonicalFixBmp fixes) noexcept
      : _canonicalUrl(std::move(canonicalUrl)), _pathBeg(pathBeg), _queryBeg(queryBeg), _fixes(fixes) {}

  std::string _canonicalUrl;
  std::size_t _pathBeg{};
  std::size_t _queryBeg{};
  CanonicalFixBmp _fixes{};
};

}  // namespace canonurl
