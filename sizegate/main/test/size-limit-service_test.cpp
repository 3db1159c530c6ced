#include "sizegate/size-limit-service.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "sizegate/body-limit-config.hpp"
#include "sizegate/body-limit-result.hpp"
#include "sizegate/body-stream.hpp"
#include "sizegate/buffer-strategy.hpp"
#include "sizegate/error-format.hpp"
#include "sizegate/http-request.hpp"
#include "sizegate/http-response.hpp"
#include "sizegate/http-status-code.hpp"
#include "sizegate/middleware.hpp"
#include "sizegate/scripted-body-stream.hpp"
#include "sizegate/size-limit-config.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

using test::ScriptedBodyStream;
using test::ScriptedBodyStreamProbe;

namespace {

HttpRequest MakeRequest(std::string_view contentType, BodyStreamPtr body) {
  HttpRequest request;
  if (!contentType.empty()) {
    request.header("Content-Type", contentType);
  }
  request.setBody(std::move(body));
  return request;
}

}  // namespace

class SizeLimitServiceTest : public ::testing::Test {
 protected:
  SizeLimitServiceTest() {
    config.withSizeLimits(SizeLimitConfig{}
                              .withDefaultLimit(100)
                              .withSpecificLimit("application/json", 50)
                              .withWildcardLimit("image/*", 200))
        .withBufferStrategy(BufferStrategy{}.withBufferedTypes({"application/json"}).withStreamedTypes({"image/*"}))
        .withErrorFormat(ErrorFormat::PlainText());
  }

  BodyLimitConfig config;
  std::shared_ptr<ScriptedBodyStreamProbe> probe = std::make_shared<ScriptedBodyStreamProbe>();
};

TEST_F(SizeLimitServiceTest, NullConfigIsRejected) {
  EXPECT_THROW(SizeLimitService(std::shared_ptr<const BodyLimitConfig>{}), std::invalid_argument);
}

TEST_F(SizeLimitServiceTest, InvalidConfigIsRejected) {
  config.withMaxChunkBytes(0);
  EXPECT_THROW(SizeLimitService{config}, std::invalid_argument);
}

TEST_F(SizeLimitServiceTest, ConfigIsShared) {
  auto shared = std::make_shared<const BodyLimitConfig>(config);
  SizeLimitService service(shared);
  SizeLimitService copy = service;
  EXPECT_EQ(&service.config(), shared.get());
  EXPECT_EQ(&copy.config(), shared.get());
}

TEST_F(SizeLimitServiceTest, DeclaredLengthRejectedWithoutReadingBody) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Chunks({"{}"}, probe));
  request.header("Content-Length", "1000");

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError(SizeLimitError::BodyTooLarge{50, 1000}));
  EXPECT_EQ(probe->nbPolls, 0U);
}

TEST_F(SizeLimitServiceTest, UnparsableDeclaredLengthDefersToEnforcement) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Chunks({"{}"}, probe));
  request.header("Content-Length", "12abc");

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(request.body(), "{}");
}

TEST_F(SizeLimitServiceTest, BufferedBodyIsMaterialized) {
  SizeLimitService service(config);
  HttpRequest request =
      MakeRequest("application/json; charset=utf-8", ScriptedBodyStream::Chunks({"{\"a\":", "1}"}, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(result.limit(), 50U);
  EXPECT_EQ(result.mode(), BodyMode::Buffered);
  EXPECT_TRUE(request.isBodyMaterialized());
  EXPECT_TRUE(probe->destroyed);
  EXPECT_EQ(request.body(), "{\"a\":1}");
}

TEST_F(SizeLimitServiceTest, BufferedBodyWithoutStream) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", nullptr);

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_TRUE(request.isBodyMaterialized());
  EXPECT_EQ(request.body(), "");
}

TEST_F(SizeLimitServiceTest, BufferedBodyTooLarge) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Repeated(2, 40, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError(SizeLimitError::BodyTooLarge{50, 80}));
}

TEST_F(SizeLimitServiceTest, BufferedTransportError) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::ChunksThenError({"{"}, "reset"));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError::Transport("reset"));
}

TEST_F(SizeLimitServiceTest, StreamedBodyIsMonitored) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Repeated(3, 60, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(result.limit(), 200U);
  EXPECT_EQ(result.mode(), BodyMode::Streamed);
  EXPECT_FALSE(request.isBodyMaterialized());
  // only the first chunk has been peeked
  EXPECT_EQ(probe->nbPolls, 1U);

  std::string received;
  for (std::string_view chunk = request.readBody(); !chunk.empty(); chunk = request.readBody()) {
    received.append(chunk);
  }
  EXPECT_EQ(received.size(), 180U);
  EXPECT_FALSE(request.bodyError());
}

TEST_F(SizeLimitServiceTest, StreamedFirstChunkTooLargeIsRejectedImmediately) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Chunks({std::string(250, 'x'), "more"}, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError(SizeLimitError::BodyTooLarge{200, 250}));
  EXPECT_EQ(probe->nbPolls, 1U);
}

TEST_F(SizeLimitServiceTest, StreamedFirstChunkAboveChunkCeiling) {
  config.withMaxChunkBytes(16);
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Chunks({std::string(17, 'x')}, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError(SizeLimitError::ChunkTooLarge{16, 17}));
}

TEST_F(SizeLimitServiceTest, StreamedEmptyBody) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Chunks({}, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_TRUE(probe->destroyed);
  EXPECT_EQ(request.body(), "");
}

TEST_F(SizeLimitServiceTest, StreamedFirstChunkTransportError) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::ChunksThenError({}, "reset", probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.isRejected());
  EXPECT_EQ(result.error(), SizeLimitError::Transport("reset"));
  EXPECT_EQ(result.error().statusCode(), http::StatusCodeBadRequest);
}

TEST_F(SizeLimitServiceTest, StreamedWithoutPeekDoesNotPoll) {
  config.withPeekFirstChunk(false);
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Chunks({std::string(250, 'x')}, probe));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(probe->nbPolls, 0U);

  EXPECT_THROW((void)request.body(), BodyReadError);
  ASSERT_TRUE(request.bodyError());
  EXPECT_EQ(*request.bodyError(), SizeLimitError(SizeLimitError::BodyTooLarge{200, 250}));
}

TEST_F(SizeLimitServiceTest, MissingContentTypeUsesDefaultLimit) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest({}, ScriptedBodyStream::Repeated(1, 10));

  BodyLimitResult result = service.prepare(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(result.limit(), 100U);
  EXPECT_EQ(result.mode(), BodyMode::Streamed);
}

TEST_F(SizeLimitServiceTest, HandleRendersRejection) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Repeated(1, 10));
  request.header("Content-Length", "1000");

  bool handlerCalled = false;
  HttpResponse response = service.handle(request, [&handlerCalled](HttpRequest&) {
    handlerCalled = true;
    return HttpResponse("ok");
  });

  EXPECT_FALSE(handlerCalled);
  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(response.body(), "413 Payload Too Large\n\nRequest size: 1000 bytes\nMaximum allowed: 50 bytes");
}

TEST_F(SizeLimitServiceTest, HandleCallsHandler) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Chunks({"{}"}));

  HttpResponse response =
      service.handle(request, [](HttpRequest& req) { return HttpResponse(std::string("got ") + std::string(req.body())); });

  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "got {}");
}

TEST_F(SizeLimitServiceTest, HandleRendersViolationSwallowedByHandler) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Repeated(3, 80));

  HttpResponse response = service.handle(request, [](HttpRequest& req) {
    try {
      [[maybe_unused]] auto body = req.body();
    } catch (const BodyReadError&) {
      // ignored on purpose, the pipeline still reports it
    }
    return HttpResponse("ok");
  });

  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(response.body(), "413 Payload Too Large\n\nRequest size: 240 bytes\nMaximum allowed: 200 bytes");
}

TEST_F(SizeLimitServiceTest, HandleRendersViolationPropagatedByHandler) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Repeated(3, 80));

  HttpResponse response = service.handle(request, [](HttpRequest& req) {
    [[maybe_unused]] auto body = req.body();
    return HttpResponse("unreachable");
  });

  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
}

TEST_F(SizeLimitServiceTest, HandleRendersViolationOnUnknownException) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("image/jpeg", ScriptedBodyStream::Repeated(3, 80));

  HttpResponse response = service.handle(request, [](HttpRequest& req) -> HttpResponse {
    try {
      [[maybe_unused]] auto body = req.body();
    } catch (const BodyReadError&) {
      throw 42;
    }
    return HttpResponse("unreachable");
  });

  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(response.body(), "413 Payload Too Large\n\nRequest size: 240 bytes\nMaximum allowed: 200 bytes");
}

TEST_F(SizeLimitServiceTest, HandlerExceptionGives500) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Chunks({"{}"}));

  HttpResponse response =
      service.handle(request, [](HttpRequest&) -> HttpResponse { throw std::runtime_error("database down"); });

  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body(), "Internal Server Error");
}

TEST_F(SizeLimitServiceTest, HandlerUnknownExceptionGives500) {
  SizeLimitService service(config);
  HttpRequest request = MakeRequest("application/json", ScriptedBodyStream::Chunks({"{}"}));

  HttpResponse response = service.handle(request, [](HttpRequest&) -> HttpResponse { throw 42; });

  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
}

TEST_F(SizeLimitServiceTest, RequestMiddlewareShortCircuitsRejections) {
  SizeLimitService service(config);
  RequestMiddleware middleware = service.middleware();

  HttpRequest rejected = MakeRequest("application/json", ScriptedBodyStream::Repeated(1, 60));
  MiddlewareResult result = middleware(rejected);
  ASSERT_TRUE(result.shouldShortCircuit());
  EXPECT_EQ(result.response().status(), http::StatusCodePayloadTooLarge);

  HttpRequest accepted = MakeRequest("application/json", ScriptedBodyStream::Repeated(1, 10));
  EXPECT_TRUE(middleware(accepted).shouldContinue());
  EXPECT_EQ(accepted.body().size(), 10U);
}

TEST_F(SizeLimitServiceTest, ResponseMiddlewareReplacesResponseOnBodyError) {
  SizeLimitService service(config);
  RequestMiddleware requestMiddleware = service.middleware();
  ResponseMiddleware responseMiddleware = service.responseMiddleware();

  HttpRequest request = MakeRequest("image/png", ScriptedBodyStream::Repeated(3, 80));
  ASSERT_TRUE(requestMiddleware(request).shouldContinue());
  EXPECT_THROW((void)request.body(), BodyReadError);

  HttpResponse response("ok");
  responseMiddleware(request, response);
  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);

  HttpRequest fine = MakeRequest("image/png", ScriptedBodyStream::Repeated(1, 80));
  ASSERT_TRUE(requestMiddleware(fine).shouldContinue());
  HttpResponse untouched("ok");
  responseMiddleware(fine, untouched);
  EXPECT_EQ(untouched.status(), http::StatusCodeOK);
  EXPECT_EQ(untouched.body(), "ok");
}

TEST_F(SizeLimitServiceTest, CustomErrorFormat) {
  config.withErrorFormat(ErrorFormat::Custom([](const SizeLimitError& error) {
    return HttpResponse(error.statusCode()).body("custom: " + error.message());
  }));
  SizeLimitService service(config);

  HttpResponse response = service.renderError(SizeLimitError::BodyTooLarge{1, 2});
  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(response.body(), "custom: Body too large: Maximum size is 1 bytes");
}

}  // namespace sizegate
