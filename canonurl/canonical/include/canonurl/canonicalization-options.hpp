#pragma once

namespace canonurl {

struct CanonicalizationOptions {
  // If true, canonical URLs end with a '/'.
  // If false, canonical URLs never end with a '/'.
  // The root path ("" or "/") is canonical in both cases.
  // Default: false
  bool appendTrailingSlash{false};

  // If true, the canonical path and query string are lowercase.
  // Default: false
  bool lowercaseUrls{false};

  CanonicalizationOptions& withAppendTrailingSlash(bool enable = true);

  CanonicalizationOptions& withLowercaseUrls(bool enable = true);

  bool operator==(const CanonicalizationOptions&) const noexcept = default;
};

}  // namespace canonurl
