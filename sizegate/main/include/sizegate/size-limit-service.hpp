#pragma once

#include <memory>

#include "sizegate/body-limit-config.hpp"
#include "sizegate/body-limit-result.hpp"
#include "sizegate/http-request.hpp"
#include "sizegate/http-response.hpp"
#include "sizegate/middleware.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Enforces per content type request body size limits.
//
// For each request:
//   1. the limit is resolved from the Content-Type (application/octet-stream if absent)
//   2. a declared Content-Length above the limit is rejected before reading anything
//   3. depending on the buffering strategy, the body is either
//        - buffered: read entirely (up to the limit) and replaced by the in-memory buffer, or
//        - streamed: replaced by a LimitedBodyStream, after an optional peek of the first chunk
//   4. violations are rendered with the configured ErrorFormat
//
// The configuration is immutable and shared, a SizeLimitService is cheap to copy and safe to use concurrently from
// several threads, as long as each request is processed by a single thread at a time.
class SizeLimitService {
 public:
  // Validates the configuration. Throws std::invalid_argument if it is invalid.
  explicit SizeLimitService(BodyLimitConfig config);

  // Validates the configuration. Throws std::invalid_argument if it is invalid or null.
  explicit SizeLimitService(std::shared_ptr<const BodyLimitConfig> config);

  // Applies the limits to given request, replacing its body with the buffered body or the monitored stream.
  // On rejection, the request body has not been (buffered path) or only partly been (peeked first chunk) consumed.
  [[nodiscard]] BodyLimitResult prepare(HttpRequest& request) const;

  // Full pipeline around a handler: prepare(), then the handler.
  // Returns the rendered error instead of calling the handler for rejected requests. A body error observed by the
  // handler (size violation while streaming, transport error) takes precedence over the handler response, even if the
  // handler swallowed it. Other handler exceptions give a 500 response.
  [[nodiscard]] HttpResponse handle(HttpRequest& request, const RequestHandler& handler) const;

  // Adapter for a request middleware chain, short-circuiting rejected requests with the rendered error.
  [[nodiscard]] RequestMiddleware middleware() const;

  // Adapter for a response middleware chain, replacing the response by the rendered body error if the handler
  // observed one. Complements middleware() for streamed bodies.
  [[nodiscard]] ResponseMiddleware responseMiddleware() const;

  // Renders given error with the configured format.
  [[nodiscard]] HttpResponse renderError(const SizeLimitError& error) const { return _config->errorFormat.render(error); }

  [[nodiscard]] const BodyLimitConfig& config() const noexcept { return *_config; }

 private:
  BodyLimitResult prepareBuffered(HttpRequest& request, std::size_t limit) const;

  BodyLimitResult prepareStreamed(HttpRequest& request, std::size_t limit) const;

  std::shared_ptr<const BodyLimitConfig> _config;
};

}  // namespace sizegate
