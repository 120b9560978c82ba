#pragma once

#include <string_view>

namespace canonurl {

// Read-only snapshot of an inbound request, as seen by the canonicalization rule.
// It does not own any of its strings: the underlying request must outlive it.
struct RequestView {
  // Builds a RequestView from a raw request target ("/path?query").
  // The query string keeps its leading '?' (it is empty when the target has no '?').
  [[nodiscard]] static RequestView Parse(std::string_view method, std::string_view scheme, std::string_view host,
                                         std::string_view target, std::string_view pathBase = {}) noexcept;

  // Tells whether the method token is GET (case-insensitive).
  [[nodiscard]] bool isGet() const noexcept;

  [[nodiscard]] bool hasQueryString() const noexcept { return !queryString.empty(); }

  std::string_view method;
  std::string_view scheme;    // "http" or "https", may be empty
  std::string_view host;      // host with optional ":port", may be empty
  std::string_view pathBase;  // mount point of the application, empty or starting with '/'
  std::string_view path;      // may be empty or "/"
  std::string_view queryString;
};

}  // namespace canonurl
