#include "canonurl/canonicalization-options.hpp"

namespace canonurl {

CanonicalizationOptions& CanonicalizationOptions::withAppendTrailingSlash(bool enable) {
  appendTrailingSlash = enable;
  return *this;
}

CanonicalizationOptions& CanonicalizationOptions::withLowercaseUrls(bool enable) {
  lowercaseUrls = enable;
  return *this;
}

}  // namespace canonurl
