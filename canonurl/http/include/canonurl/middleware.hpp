#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "canonurl/http-response.hpp"
#include "canonurl/request-view.hpp"

namespace canonurl {

// Result of running a middleware stage.
class MiddlewareResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Default to Continue.
  // Synonym of MiddlewareResult::Continue.
  MiddlewareResult() noexcept = default;

  // Constructor to short-circuit response with given one.
  // Synonym of MiddlewareResult::ShortCircuit.
  explicit MiddlewareResult(HttpResponse response) noexcept
      : _decision(Decision::ShortCircuit), _response(std::move(response)) {}

  // Returns a MiddlewareResult indicating to continue processing.
  static MiddlewareResult Continue() noexcept { return {}; }

  // Returns a MiddlewareResult indicating to short-circuit with the given response.
  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept { return MiddlewareResult{std::move(response)}; }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Continue};
  HttpResponse _response;
};

// Middleware invoked before routing. It returns a short-circuit response to skip the handler.
using RequestMiddleware = std::function<MiddlewareResult(const RequestView&)>;

}  // namespace canonurl
