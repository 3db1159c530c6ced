#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "sizegate/http-request.hpp"
#include "sizegate/http-response.hpp"

namespace sizegate {

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

// Middleware invoked before the route handler executes. It may mutate the request (for instance replace its body)
// and return a short-circuit response to skip subsequent middleware and the handler.
using RequestMiddleware = std::function<MiddlewareResult(HttpRequest&)>;

// Middleware invoked after the handler produces a response. It can amend or replace the response.
using ResponseMiddleware = std::function<void(const HttpRequest&, HttpResponse&)>;

// Application handler producing the response of a request.
using RequestHandler = std::function<HttpResponse(HttpRequest&)>;

}  // namespace sizegate
