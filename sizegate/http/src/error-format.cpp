#include "sizegate/error-format.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "sizegate/http-constants.hpp"
#include "sizegate/http-response.hpp"
#include "sizegate/http-status-code.hpp"
#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/size-limit-error.hpp"

#ifdef SIZEGATE_ENABLE_GLAZE
#include <map>
#include <optional>
#include <vector>

#include "sizegate/json-serializer.hpp"
#endif

namespace sizegate {

namespace {

// "413 Payload Too Large"
std::string StatusLine(http::StatusCode status) { return std::format("{} {}", status, http::ReasonPhraseFor(status)); }

#ifdef SIZEGATE_ENABLE_GLAZE

bool IsInternal(const SizeLimitError::Other& other) noexcept {
  return other.origin == SizeLimitError::Other::Origin::Internal;
}

struct SimpleJsonBody {
  std::string error;
  std::string message;
  std::optional<std::string> details;
  http::StatusCode statusCode;
};

struct JsonApiErrorDetail {
  std::string status;
  std::string title;
  std::string detail;
  std::optional<std::map<std::string, std::size_t>> meta;
};

struct JsonApiBody {
  std::vector<JsonApiErrorDetail> errors;
};

#endif

}  // namespace

}  // namespace sizegate

#ifdef SIZEGATE_ENABLE_GLAZE

template <>
struct glz::meta<sizegate::SimpleJsonBody> {
  using T = sizegate::SimpleJsonBody;
  static constexpr auto value =
      glz::object("error", &T::error, "message", &T::message, "details", &T::details, "status_code", &T::statusCode);
};

template <>
struct glz::meta<sizegate::JsonApiErrorDetail> {
  using T = sizegate::JsonApiErrorDetail;
  static constexpr auto value =
      glz::object("status", &T::status, "title", &T::title, "detail", &T::detail, "meta", &T::meta);
};

template <>
struct glz::meta<sizegate::JsonApiBody> {
  using T = sizegate::JsonApiBody;
  static constexpr auto value = glz::object("errors", &T::errors);
};

#endif

namespace sizegate {

namespace {

#ifdef SIZEGATE_ENABLE_GLAZE

class SimpleJsonRenderer final : public ErrorRenderer {
 public:
  [[nodiscard]] HttpResponse render(const SizeLimitError& error) const override {
    const http::StatusCode status = error.statusCode();
    SimpleJsonBody body{StatusLine(status), {}, {}, status};
    std::visit(
        [&body](const auto& err) {
          using T = std::decay_t<decltype(err)>;
          if constexpr (std::is_same_v<T, SizeLimitError::BodyTooLarge>) {
            body.message = "Payload too large";
            body.details =
                std::format("Request size: {} bytes, Maximum allowed: {} bytes", err.actualSize, err.maxSize);
          } else if constexpr (std::is_same_v<T, SizeLimitError::ChunkTooLarge>) {
            body.message = "Chunk too large";
            body.details =
                std::format("Chunk size: {} bytes, Maximum allowed: {} bytes", err.actualChunkSize, err.maxChunkSize);
          } else if constexpr (std::is_same_v<T, SizeLimitError::SizeOverflow>) {
            body.message = "Size overflow";
            body.details = "Request size calculation resulted in an overflow";
          } else {
            body.message = IsInternal(err) ? "Internal server error" : "Bad request";
            body.details = err.message;
          }
        },
        error.kind());
    return HttpResponse(status).body(SerializeToJson(body), http::ContentTypeApplicationJson);
  }
};

class JsonApiRenderer final : public ErrorRenderer {
 public:
  [[nodiscard]] HttpResponse render(const SizeLimitError& error) const override {
    const http::StatusCode status = error.statusCode();
    JsonApiErrorDetail detail{std::to_string(status), {}, {}, {}};
    std::visit(
        [&detail](const auto& err) {
          using T = std::decay_t<decltype(err)>;
          if constexpr (std::is_same_v<T, SizeLimitError::BodyTooLarge>) {
            detail.title = "Payload Too Large";
            detail.detail = std::format("Request body exceeds the maximum allowed size of {} bytes", err.maxSize);
            detail.meta = std::map<std::string, std::size_t>{{"max_size", err.maxSize},
                                                             {"actual_size", err.actualSize}};
          } else if constexpr (std::is_same_v<T, SizeLimitError::ChunkTooLarge>) {
            detail.title = "Chunk Too Large";
            detail.detail =
                std::format("Request chunk exceeds the maximum allowed size of {} bytes", err.maxChunkSize);
            detail.meta = std::map<std::string, std::size_t>{{"max_chunk_size", err.maxChunkSize},
                                                             {"actual_chunk_size", err.actualChunkSize}};
          } else if constexpr (std::is_same_v<T, SizeLimitError::SizeOverflow>) {
            detail.title = "Size Overflow";
            detail.detail = "Request size calculation resulted in an overflow";
          } else {
            detail.title = IsInternal(err) ? http::ReasonInternalServerError : http::ReasonBadRequest;
            detail.detail = err.message;
          }
        },
        error.kind());
    JsonApiBody body;
    body.errors.push_back(std::move(detail));
    return HttpResponse(status).body(SerializeToJson(body), http::ContentTypeApplicationJson);
  }
};

#endif

class PlainTextRenderer final : public ErrorRenderer {
 public:
  [[nodiscard]] HttpResponse render(const SizeLimitError& error) const override {
    const http::StatusCode status = error.statusCode();
    std::string text = std::visit(
        [status](const auto& err) -> std::string {
          using T = std::decay_t<decltype(err)>;
          if constexpr (std::is_same_v<T, SizeLimitError::BodyTooLarge>) {
            return std::format("{}\n\nRequest size: {} bytes\nMaximum allowed: {} bytes", StatusLine(status),
                               err.actualSize, err.maxSize);
          } else if constexpr (std::is_same_v<T, SizeLimitError::ChunkTooLarge>) {
            return std::format("{}\n\nChunk size: {} bytes\nMaximum allowed: {} bytes", StatusLine(status),
                               err.actualChunkSize, err.maxChunkSize);
          } else if constexpr (std::is_same_v<T, SizeLimitError::SizeOverflow>) {
            return std::format("{}\n\nRequest size calculation resulted in an overflow", StatusLine(status));
          } else {
            return std::format("{}\n\n{}", StatusLine(status), err.message);
          }
        },
        error.kind());
    return HttpResponse(status).body(std::move(text), http::ContentTypeTextPlain);
  }
};

class FunctionRenderer final : public ErrorRenderer {
 public:
  explicit FunctionRenderer(ErrorFormat::RenderFunc func) noexcept : _func(std::move(func)) {}

  [[nodiscard]] HttpResponse render(const SizeLimitError& error) const override { return _func(error); }

 private:
  ErrorFormat::RenderFunc _func;
};

}  // namespace

#ifdef SIZEGATE_ENABLE_GLAZE
ErrorFormat::ErrorFormat() : ErrorFormat(SimpleJson()) {}

ErrorFormat ErrorFormat::SimpleJson() { return ErrorFormat(std::make_shared<const SimpleJsonRenderer>()); }

ErrorFormat ErrorFormat::JsonApi() { return ErrorFormat(std::make_shared<const JsonApiRenderer>()); }
#else
ErrorFormat::ErrorFormat() : ErrorFormat(PlainText()) {}
#endif

ErrorFormat ErrorFormat::PlainText() { return ErrorFormat(std::make_shared<const PlainTextRenderer>()); }

ErrorFormat ErrorFormat::Custom(RenderFunc func) {
  if (!func) {
    throw invalid_argument("Custom error format requires a render function");
  }
  return ErrorFormat(std::make_shared<const FunctionRenderer>(std::move(func)));
}

}  // namespace sizegate
