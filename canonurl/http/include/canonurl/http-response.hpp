#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "canonurl/http-constants.hpp"
#include "canonurl/http-header.hpp"
#include "canonurl/http-status-code.hpp"

namespace canonurl {

// Response produced by a middleware that short-circuits the request.
// It only carries the status line and headers: the embedding server is responsible for serializing and sending it.
class HttpResponse {
 public:
  // Constructs an HttpResponse with the given status code and optional reason phrase.
  // If no reason is given, the canonical reason phrase of the status code is used.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Get the value of the header with given key (case-insensitive), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Like headerValue() but returns an empty string_view when the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    const auto optValue = headerValue(key);
    return optValue ? *optValue : std::string_view{};
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Inserts or replaces the header with given key (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value) &;

  HttpResponse&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  // Inserts or replaces the Location header.
  HttpResponse& location(std::string_view src) & { return header(http::Location, src); }

  HttpResponse&& location(std::string_view src) && { return std::move(header(http::Location, src)); }

  bool operator==(const HttpResponse&) const = default;

 private:
  http::StatusCode _status;
  std::string _reason;
  std::vector<http::Header> _headers;
};

}  // namespace canonurl
