#include "sizegate/buffer-strategy.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "sizegate/content-type.hpp"

namespace sizegate {

TEST(BufferStrategyTest, DefaultConstructedStreamsEverything) {
  BufferStrategy strategy;

  EXPECT_TRUE(strategy.bufferedTypes().empty());
  EXPECT_TRUE(strategy.streamedTypes().empty());
  EXPECT_FALSE(strategy.defaultIsBuffered());
  EXPECT_FALSE(strategy.shouldBuffer("application/json"));
  EXPECT_FALSE(strategy.shouldBuffer("image/png"));
  EXPECT_EQ(strategy, BufferStrategy::AllStreamed());
}

TEST(BufferStrategyTest, AllBuffered) {
  const auto strategy = BufferStrategy::AllBuffered();

  EXPECT_TRUE(strategy.shouldBuffer("application/json"));
  EXPECT_TRUE(strategy.shouldBuffer("video/mp4"));
  EXPECT_TRUE(strategy.shouldBuffer(kUnknownContentType));
}

TEST(BufferStrategyTest, WithDefaults) {
  const auto strategy = BufferStrategy::WithDefaults();

  EXPECT_TRUE(strategy.shouldBuffer("application/json"));
  EXPECT_TRUE(strategy.shouldBuffer("multipart/form-data; boundary=xyz"));
  EXPECT_TRUE(strategy.shouldBuffer("text/plain"));
  EXPECT_TRUE(strategy.shouldBuffer("text/csv"));
  EXPECT_TRUE(strategy.shouldBuffer("application/xml"));
  EXPECT_TRUE(strategy.shouldBuffer("application/x-www-form-urlencoded"));

  EXPECT_FALSE(strategy.shouldBuffer("video/mp4"));
  EXPECT_FALSE(strategy.shouldBuffer("image/jpeg"));
  EXPECT_FALSE(strategy.shouldBuffer("audio/ogg"));
  EXPECT_FALSE(strategy.shouldBuffer("application/octet-stream"));

  // not listed, falls back to default (streamed)
  EXPECT_FALSE(strategy.shouldBuffer("application/pdf"));
  EXPECT_FALSE(strategy.defaultIsBuffered());
}

TEST(BufferStrategyTest, ExactMatchWinsOverWildcard) {
  BufferStrategy strategy;
  strategy.withBufferedTypes({"application/json"}).withStreamedTypes({"application/*"});

  EXPECT_TRUE(strategy.shouldBuffer("application/json"));
  EXPECT_FALSE(strategy.shouldBuffer("application/xml"));
}

TEST(BufferStrategyTest, StreamedExactMatchWinsOverBufferedWildcard) {
  BufferStrategy strategy;
  strategy.withBufferedTypes({"image/*"}).withStreamedTypes({"image/png"});

  EXPECT_FALSE(strategy.shouldBuffer("image/png"));
  EXPECT_TRUE(strategy.shouldBuffer("image/gif"));
}

TEST(BufferStrategyTest, BufferedExactMatchWinsOverStreamedExactMatch) {
  BufferStrategy strategy;
  strategy.withBufferedTypes({"text/plain"}).withStreamedTypes({"text/plain"});

  EXPECT_TRUE(strategy.shouldBuffer("text/plain"));
}

TEST(BufferStrategyTest, BufferedWildcardWinsOverStreamedWildcard) {
  BufferStrategy strategy;
  strategy.withStreamedTypes({"text/*"}).withBufferedTypes({"text/*"});

  EXPECT_TRUE(strategy.shouldBuffer("text/html"));
}

TEST(BufferStrategyTest, PrefixMatchOfWildcards) {
  // Patterns not ending with "/*" never match by prefix.
  BufferStrategy strategy;
  strategy.withBufferedTypes({"application/vnd.*"}).withStreamedTypes({"application/x-*"});

  EXPECT_FALSE(IsWildcardPattern("application/vnd.*"));
  EXPECT_FALSE(strategy.shouldBuffer("application/vnd.api+json"));
  EXPECT_FALSE(strategy.shouldBuffer("application/x-tar"));
  EXPECT_FALSE(strategy.shouldBuffer("application/pdf"));

  strategy.clearAllTypes();
  strategy.withBufferedTypes({"application/vnd/*"}).withStreamedTypes({"application/x/*"});

  EXPECT_TRUE(strategy.shouldBuffer("application/vnd/api+json"));
  EXPECT_FALSE(strategy.shouldBuffer("application/x/tar"));
  strategy.withDefaultBuffered(true);
  EXPECT_FALSE(strategy.shouldBuffer("application/x/tar"));
  EXPECT_TRUE(strategy.shouldBuffer("application/pdf"));
}

TEST(BufferStrategyTest, NormalizesContentType) {
  BufferStrategy strategy;
  strategy.withBufferedTypes({"Application/JSON"});

  EXPECT_EQ(strategy.bufferedTypes().front(), "application/json");
  EXPECT_TRUE(strategy.shouldBuffer("application/json; charset=utf-8"));
  EXPECT_TRUE(strategy.shouldBuffer("  APPLICATION/json  "));
}

TEST(BufferStrategyTest, WithTypesAppends) {
  auto strategy = BufferStrategy::WithDefaults();
  const auto nbBuffered = strategy.bufferedTypes().size();
  const auto nbStreamed = strategy.streamedTypes().size();

  strategy.withBufferedTypes({"application/yaml", "application/toml"}).withStreamedTypes({"font/*"});

  EXPECT_EQ(strategy.bufferedTypes().size(), nbBuffered + 2U);
  EXPECT_EQ(strategy.streamedTypes().size(), nbStreamed + 1U);
  EXPECT_TRUE(strategy.shouldBuffer("application/yaml"));
  EXPECT_FALSE(strategy.shouldBuffer("font/woff2"));
}

TEST(BufferStrategyTest, ClearTypes) {
  auto strategy = BufferStrategy::WithDefaults();

  strategy.clearBufferedTypes();
  EXPECT_TRUE(strategy.bufferedTypes().empty());
  EXPECT_FALSE(strategy.streamedTypes().empty());
  EXPECT_FALSE(strategy.shouldBuffer("application/json"));

  strategy.withDefaultBuffered(true);
  EXPECT_TRUE(strategy.shouldBuffer("application/json"));
  EXPECT_FALSE(strategy.shouldBuffer("image/png"));

  strategy.clearStreamedTypes();
  EXPECT_TRUE(strategy.shouldBuffer("image/png"));

  strategy = BufferStrategy::WithDefaults();
  strategy.clearAllTypes();
  EXPECT_TRUE(strategy.bufferedTypes().empty());
  EXPECT_TRUE(strategy.streamedTypes().empty());
}

TEST(BufferStrategyTest, UnknownContentTypeFallsBackToStreamed) {
  const auto strategy = BufferStrategy::WithDefaults();

  EXPECT_FALSE(strategy.shouldBuffer(kUnknownContentType));
  EXPECT_FALSE(strategy.shouldBuffer(""));
}

TEST(BufferStrategyTest, Validate) {
  auto strategy = BufferStrategy::WithDefaults();
  EXPECT_NO_THROW(strategy.validate());

  strategy.withBufferedTypes({""});
  EXPECT_THROW(strategy.validate(), std::invalid_argument);

  strategy.clearBufferedTypes();
  strategy.withStreamedTypes({""});
  EXPECT_THROW(strategy.validate(), std::invalid_argument);
}

}  // namespace sizegate
