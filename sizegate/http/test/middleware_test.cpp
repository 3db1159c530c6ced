#include "sizegate/middleware.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "sizegate/http-request.hpp"
#include "sizegate/http-response.hpp"
#include "sizegate/http-status-code.hpp"

namespace sizegate {

TEST(MiddlewareResultTest, DefaultContinues) {
  MiddlewareResult result;

  EXPECT_TRUE(result.shouldContinue());
  EXPECT_FALSE(result.shouldShortCircuit());
  EXPECT_TRUE(MiddlewareResult::Continue().shouldContinue());
}

TEST(MiddlewareResultTest, ShortCircuit) {
  auto result = MiddlewareResult::ShortCircuit(HttpResponse(http::StatusCodePayloadTooLarge).body("too big"));

  EXPECT_TRUE(result.shouldShortCircuit());
  EXPECT_EQ(result.response().status(), http::StatusCodePayloadTooLarge);

  HttpResponse resp = std::move(result).takeResponse();
  EXPECT_EQ(resp.body(), "too big");
}

TEST(MiddlewareResultTest, MiddlewareCanReplaceBody) {
  RequestMiddleware middleware = [](HttpRequest& req) {
    req.setBody(std::string("replaced"));
    return MiddlewareResult::Continue();
  };
  RequestHandler handler = [](HttpRequest& req) { return HttpResponse(req.body()); };

  HttpRequest req;
  req.setBody(std::string("original"));
  ASSERT_TRUE(middleware(req).shouldContinue());
  EXPECT_EQ(handler(req).body(), "replaced");
}

}  // namespace sizegate
