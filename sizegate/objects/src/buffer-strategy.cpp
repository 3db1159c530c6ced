#include "sizegate/buffer-strategy.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "sizegate/content-type.hpp"
#include "sizegate/invalid-argument-exception.hpp"
#include "sizegate/toupperlower.hpp"

namespace sizegate {

namespace {

bool ContainsPattern(const std::vector<std::string>& patterns, std::string_view value) {
  return std::ranges::find(patterns, value) != patterns.end();
}

// Matches wildcards by prefix, "text/*" matches anything starting with "text/".
bool MatchesWildcardPrefix(const std::vector<std::string>& patterns, std::string_view contentType) {
  return std::ranges::any_of(patterns, [contentType](std::string_view pattern) {
    return IsWildcardPattern(pattern) && contentType.starts_with(pattern.substr(0, pattern.size() - 1U));
  });
}

void AppendLowerCased(std::vector<std::string>& patterns, std::initializer_list<std::string_view> newPatterns) {
  patterns.reserve(patterns.size() + newPatterns.size());
  for (std::string_view pattern : newPatterns) {
    patterns.push_back(ToLowerCopy(pattern));
  }
}

}  // namespace

BufferStrategy BufferStrategy::WithDefaults() {
  BufferStrategy strategy;
  strategy
      .withBufferedTypes({"application/json", "multipart/form-data", "text/*", "application/xml",
                          "application/x-www-form-urlencoded"})
      .withStreamedTypes({"video/*", "image/*", "audio/*", "application/octet-stream"});
  return strategy;
}

BufferStrategy BufferStrategy::AllBuffered() {
  BufferStrategy strategy;
  strategy.withDefaultBuffered(true);
  return strategy;
}

BufferStrategy BufferStrategy::AllStreamed() { return {}; }

void BufferStrategy::validate() const {
  const auto isEmpty = [](const std::string& pattern) { return pattern.empty(); };
  if (std::ranges::any_of(_bufferedTypes, isEmpty)) {
    throw invalid_argument("buffered content type patterns must not be empty");
  }
  if (std::ranges::any_of(_streamedTypes, isEmpty)) {
    throw invalid_argument("streamed content type patterns must not be empty");
  }
}

bool BufferStrategy::shouldBuffer(std::string_view contentType) const {
  const std::string normalized = NormalizeContentType(contentType);

  if (ContainsPattern(_bufferedTypes, normalized)) {
    return true;
  }
  if (ContainsPattern(_streamedTypes, normalized)) {
    return false;
  }

  const std::string wildcard = WildcardKey(normalized);
  if (!wildcard.empty()) {
    if (ContainsPattern(_bufferedTypes, wildcard)) {
      return true;
    }
    if (ContainsPattern(_streamedTypes, wildcard)) {
      return false;
    }
  }

  if (MatchesWildcardPrefix(_bufferedTypes, normalized)) {
    return true;
  }
  if (MatchesWildcardPrefix(_streamedTypes, normalized)) {
    return false;
  }

  return _defaultIsBuffered;
}

BufferStrategy& BufferStrategy::withBufferedTypes(std::initializer_list<std::string_view> patterns) {
  AppendLowerCased(_bufferedTypes, patterns);
  return *this;
}

BufferStrategy& BufferStrategy::withStreamedTypes(std::initializer_list<std::string_view> patterns) {
  AppendLowerCased(_streamedTypes, patterns);
  return *this;
}

BufferStrategy& BufferStrategy::withDefaultBuffered(bool buffered) {
  _defaultIsBuffered = buffered;
  return *this;
}

}  // namespace sizegate
