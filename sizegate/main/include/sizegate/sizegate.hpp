// sizegate Umbrella Header
//
// Include this single header to pull in the public request body size limit API:
//   - Pipeline (SizeLimitService, BodyLimitConfig, BodyLimitResult)
//   - Limits and buffering policy (SizeLimit, SizeLimitConfig, BufferStrategy)
//   - Enforcers (LimitedBodyStream, ReadBodyWithLimit, CheckDeclaredContentLength)
//   - Request / Response primitives and error rendering
//
// Usage Example:
//    #include <sizegate/sizegate.hpp>
//    using namespace sizegate;
//    SizeLimitService service(BodyLimitConfig{}.withSizeLimits(
//        SizeLimitConfig{}.withDefaultLimit("1MB").withWildcardLimit("image/*", "10MB")));
//    HttpResponse resp = service.handle(request, [](HttpRequest& req) { return HttpResponse(req.body()); });

#pragma once

// Pipeline
#include "sizegate/body-limit-config.hpp"   // IWYU pragma: export
#include "sizegate/body-limit-result.hpp"   // IWYU pragma: export
#include "sizegate/size-limit-service.hpp"  // IWYU pragma: export

// Enforcers
#include "sizegate/buffered-body-reader.hpp"  // IWYU pragma: export
#include "sizegate/early-reject.hpp"          // IWYU pragma: export
#include "sizegate/limited-body-stream.hpp"   // IWYU pragma: export
#include "sizegate/prefixed-body-stream.hpp"  // IWYU pragma: export

// Configuration
#include "sizegate/buffer-strategy.hpp"    // IWYU pragma: export
#include "sizegate/size-limit-config.hpp"  // IWYU pragma: export
#include "sizegate/size-limit.hpp"         // IWYU pragma: export

// HTTP primitives
#include "sizegate/body-stream.hpp"       // IWYU pragma: export
#include "sizegate/error-format.hpp"      // IWYU pragma: export
#include "sizegate/http-constants.hpp"    // IWYU pragma: export
#include "sizegate/http-request.hpp"      // IWYU pragma: export
#include "sizegate/http-response.hpp"     // IWYU pragma: export
#include "sizegate/http-status-code.hpp"  // IWYU pragma: export
#include "sizegate/middleware.hpp"        // IWYU pragma: export
#include "sizegate/size-limit-error.hpp"  // IWYU pragma: export
