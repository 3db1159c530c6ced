#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "sizegate/http-response.hpp"
#include "sizegate/size-limit-error.hpp"

namespace sizegate {

// Renders a SizeLimitError into the HTTP response sent back to the client.
// Implementations must be thread safe, a single renderer is shared by all requests.
class ErrorRenderer {
 public:
  ErrorRenderer() noexcept = default;

  ErrorRenderer(const ErrorRenderer&) = delete;
  ErrorRenderer(ErrorRenderer&&) = delete;
  ErrorRenderer& operator=(const ErrorRenderer&) = delete;
  ErrorRenderer& operator=(ErrorRenderer&&) = delete;

  virtual ~ErrorRenderer() = default;

  [[nodiscard]] virtual HttpResponse render(const SizeLimitError& error) const = 0;
};

// Value type selecting how size limit errors are rendered. Cheap to copy (shares an immutable renderer).
//   - SimpleJson: {"error":"413 Payload Too Large","message":"Payload too large","details":"...","status_code":413}
//   - JsonApi:    {"errors":[{"status":"413","title":"Payload Too Large","detail":"...","meta":{...}}]}
//   - PlainText:  "413 Payload Too Large\n\nRequest size: 80 bytes\nMaximum allowed: 50 bytes"
//   - Custom:     user provided function
// JSON formats are only available when sizegate is built with glaze support.
class ErrorFormat {
 public:
  using RenderFunc = std::function<HttpResponse(const SizeLimitError&)>;

  // Default format: SimpleJson if JSON support is compiled in, PlainText otherwise.
  ErrorFormat();

  explicit ErrorFormat(std::shared_ptr<const ErrorRenderer> renderer) noexcept : _renderer(std::move(renderer)) {}

#ifdef SIZEGATE_ENABLE_GLAZE
  static ErrorFormat SimpleJson();

  static ErrorFormat JsonApi();
#endif

  static ErrorFormat PlainText();

  // Throws invalid_argument if 'func' is empty.
  static ErrorFormat Custom(RenderFunc func);

  // Renders given error. Should only be called on a valid format.
  [[nodiscard]] HttpResponse render(const SizeLimitError& error) const { return _renderer->render(error); }

  // Tells whether this format holds a renderer.
  [[nodiscard]] bool valid() const noexcept { return _renderer != nullptr; }

  [[nodiscard]] const ErrorRenderer* renderer() const noexcept { return _renderer.get(); }

 private:
  std::shared_ptr<const ErrorRenderer> _renderer;
};

}  // namespace sizegate
