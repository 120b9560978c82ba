#include "canonurl/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "canonurl/http-constants.hpp"
#include "canonurl/http-status-code.hpp"
#include "canonurl/string-equal-ignore-case.hpp"

namespace canonurl {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason)
    : _status(code), _reason(reason.empty() ? http::ReasonPhraseFor(code) : reason) {}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [key](const http::Header& header) { return CaseInsensitiveEqual(header.name(), key); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) & {
  const auto it = std::ranges::find_if(
      _headers, [key](const http::Header& header) { return CaseInsensitiveEqual(header.name(), key); });
  if (it == _headers.end()) {
    _headers.emplace_back(key, value);
  } else {
    it->setValue(value);
  }
  return *this;
}

}  // namespace canonurl
