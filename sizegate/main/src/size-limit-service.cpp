#include "sizegate/size-limit-service.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "sizegate/body-limit-config.hpp"
#include "sizegate/body-limit-result.hpp"
#include "sizegate/body-stream.hpp"
#include "sizegate/buffered-body-reader.hpp"
#include "sizegate/content-type.hpp"
#include "sizegate/early-reject.hpp"
#include "sizegate/enforcement-state.hpp"
#include "sizegate/http-constants.hpp"
#include "sizegate/http-request.hpp"
#include "sizegate/http-response.hpp"
#include "sizegate/http-status-code.hpp"
#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/limited-body-stream.hpp"
#include "sizegate/log.hpp"
#include "sizegate/middleware.hpp"
#include "sizegate/prefixed-body-stream.hpp"

namespace sizegate {

namespace {

std::shared_ptr<const BodyLimitConfig> ValidatedConfig(std::shared_ptr<const BodyLimitConfig> config) {
  if (!config) {
    throw invalid_argument("SizeLimitService requires a configuration");
  }
  config->validate();
  return config;
}

HttpResponse InternalServerError() {
  return HttpResponse(http::StatusCodeInternalServerError).body(http::ReasonInternalServerError);
}

}  // namespace

SizeLimitService::SizeLimitService(BodyLimitConfig config)
    : SizeLimitService(std::make_shared<const BodyLimitConfig>(std::move(config))) {}

SizeLimitService::SizeLimitService(std::shared_ptr<const BodyLimitConfig> config)
    : _config(ValidatedConfig(std::move(config))) {}

BodyLimitResult SizeLimitService::prepare(HttpRequest& request) const {
  const std::string_view contentType = request.contentType().value_or(kUnknownContentType);
  const std::size_t limit = _config->sizeLimits.limitFor(contentType);

  const auto declaredLength = request.declaredContentLength();
  if (!declaredLength) {
    const auto rawLength = request.headerValue(http::ContentLength);
    if (rawLength) {
      log::debug("Ignoring unparsable Content-Length '{}', body size will be enforced while reading", *rawLength);
    }
  }
  auto optError = CheckDeclaredContentLength(declaredLength, limit);
  if (optError) {
    log::debug("Rejecting request of type '{}': declared Content-Length {} exceeds limit {}", contentType,
               *declaredLength, limit);
    return BodyLimitResult::Reject(std::move(*optError));
  }

  if (_config->bufferStrategy.shouldBuffer(contentType)) {
    return prepareBuffered(request, limit);
  }
  return prepareStreamed(request, limit);
}

BodyLimitResult SizeLimitService::prepareBuffered(HttpRequest& request, std::size_t limit) const {
  BodyStreamPtr body = request.takeBody();
  if (!body) {
    request.setBody(std::string{});
    return BodyLimitResult::Continue(limit, BodyMode::Buffered);
  }

  BufferedBody buffered = ReadBodyWithLimit(*body, limit);
  if (buffered.hasError()) {
    const SizeLimitError& error = buffered.error();
    if (error.is<SizeLimitError::Other>()) {
      log::warn("Error while buffering request body: {}", error.message());
    } else {
      log::debug("Rejecting buffered request body: {}", error.message());
    }
    return BodyLimitResult::Reject(error);
  }

  request.setBody(std::move(buffered).takeBody());
  return BodyLimitResult::Continue(limit, BodyMode::Buffered);
}

BodyLimitResult SizeLimitService::prepareStreamed(HttpRequest& request, std::size_t limit) const {
  BodyStreamPtr body = request.takeBody();
  if (!body) {
    return BodyLimitResult::Continue(limit, BodyMode::Streamed);
  }

  const std::size_t maxChunkBytes = _config->maxChunkBytes;
  if (!_config->peekFirstChunk) {
    request.setBody(std::make_unique<LimitedBodyStream>(std::move(body), limit, maxChunkBytes));
    return BodyLimitResult::Continue(limit, BodyMode::Streamed);
  }

  BodyChunk first = body->next();
  switch (first.kind()) {
    case BodyChunk::Kind::Data: {
      EnforcementState state;
      auto optError = AccountChunk(state, first.size(), limit, maxChunkBytes);
      if (optError) {
        log::debug("Rejecting streamed request body on its first chunk: {}", optError->message());
        return BodyLimitResult::Reject(std::move(*optError));
      }
      auto rest = std::make_unique<LimitedBodyStream>(std::move(body), limit, maxChunkBytes, state.bytesRead);
      request.setBody(std::make_unique<PrefixedBodyStream>(std::move(first), std::move(rest)));
      break;
    }
    case BodyChunk::Kind::End:
      request.setBody(std::make_unique<StringBodyStream>(std::string{}));
      break;
    case BodyChunk::Kind::Error:
      log::warn("Error while reading first chunk of request body: {}", first.error().message());
      return BodyLimitResult::Reject(first.error());
  }
  return BodyLimitResult::Continue(limit, BodyMode::Streamed);
}

HttpResponse SizeLimitService::handle(HttpRequest& request, const RequestHandler& handler) const {
  const BodyLimitResult result = prepare(request);
  if (result.isRejected()) {
    return renderError(result.error());
  }

  try {
    HttpResponse response = handler(request);
    if (request.bodyError()) {
      log::debug("Handler observed a request body error: {}", request.bodyError()->message());
      return renderError(*request.bodyError());
    }
    return response;
  } catch (const std::exception& ex) {
    if (request.bodyError()) {
      log::debug("Handler failed after a request body error ({}): {}", request.bodyError()->message(), ex.what());
      return renderError(*request.bodyError());
    }
    log::error("Exception in request handler: {}", ex.what());
  } catch (...) {
    if (request.bodyError()) {
      log::debug("Handler failed after a request body error ({}): unknown exception", request.bodyError()->message());
      return renderError(*request.bodyError());
    }
    log::error("Unknown exception in request handler");
  }
  return InternalServerError();
}

RequestMiddleware SizeLimitService::middleware() const {
  return [service = *this](HttpRequest& request) {
    const BodyLimitResult result = service.prepare(request);
    if (result.isRejected()) {
      return MiddlewareResult::ShortCircuit(service.renderError(result.error()));
    }
    return MiddlewareResult::Continue();
  };
}

ResponseMiddleware SizeLimitService::responseMiddleware() const {
  return [service = *this](const HttpRequest& request, HttpResponse& response) {
    if (request.bodyError()) {
      response = service.renderError(*request.bodyError());
    }
  };
}

}  // namespace sizegate
