#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace sizegate {

// Decides, per content type, whether a request body is read entirely in memory before invoking the handler
// (buffered) or handed to the handler as a size-monitored stream (streamed).
// Patterns are either exact ("application/json") or wildcards ("image/*"), lower-cased on insertion.
// Both lists may overlap, shouldBuffer defines the precedence.
class BufferStrategy {
 public:
  // Empty lists, everything is streamed.
  BufferStrategy() noexcept = default;

  // Buffered: application/json, multipart/form-data, text/*, application/xml, application/x-www-form-urlencoded.
  // Streamed: video/*, image/*, audio/*, application/octet-stream.
  // Other types are streamed.
  static BufferStrategy WithDefaults();

  // Empty lists, everything is buffered.
  static BufferStrategy AllBuffered();

  // Empty lists, everything is streamed.
  static BufferStrategy AllStreamed();

  // Validates the strategy. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Tells whether a body of given Content-Type header value should be buffered. First match wins:
  //  1. exact match in buffered types     -> true
  //  2. exact match in streamed types     -> false
  //  3. "type/*" match in buffered types  -> true
  //  4. "type/*" match in streamed types  -> false
  //  5. a buffered wildcard whose prefix (text before '*') prefixes the content type -> true
  //  6. same for streamed wildcards       -> false
  //  7. default behavior
  [[nodiscard]] bool shouldBuffer(std::string_view contentType) const;

  // Append patterns to the buffered list.
  BufferStrategy& withBufferedTypes(std::initializer_list<std::string_view> patterns);

  // Append patterns to the streamed list.
  BufferStrategy& withStreamedTypes(std::initializer_list<std::string_view> patterns);

  // Set the behavior for content types matching no pattern.
  BufferStrategy& withDefaultBuffered(bool buffered = true);

  void clearBufferedTypes() noexcept { _bufferedTypes.clear(); }

  void clearStreamedTypes() noexcept { _streamedTypes.clear(); }

  void clearAllTypes() noexcept {
    clearBufferedTypes();
    clearStreamedTypes();
  }

  [[nodiscard]] const std::vector<std::string>& bufferedTypes() const noexcept { return _bufferedTypes; }

  [[nodiscard]] const std::vector<std::string>& streamedTypes() const noexcept { return _streamedTypes; }

  [[nodiscard]] bool defaultIsBuffered() const noexcept { return _defaultIsBuffered; }

  bool operator==(const BufferStrategy&) const noexcept = default;

 private:
  std::vector<std::string> _bufferedTypes;
  std::vector<std::string> _streamedTypes;
  bool _defaultIsBuffered{false};
};

}  // namespace sizegate
