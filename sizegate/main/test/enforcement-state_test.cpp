#include "sizegate/enforcement-state.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>

#include "sizegate/size-limit-error.hpp"

namespace sizegate {

TEST(EnforcementStateTest, AccumulatesWithinLimit) {
  EnforcementState state;
  EXPECT_FALSE(AccountChunk(state, 40, 50, kDefaultMaxChunkBytes));
  EXPECT_EQ(state.bytesRead, 40U);
  EXPECT_FALSE(AccountChunk(state, 10, 50, kDefaultMaxChunkBytes));
  EXPECT_EQ(state.bytesRead, 50U);
  EXPECT_FALSE(state.hasViolated);
}

TEST(EnforcementStateTest, EmptyChunkAtLimit) {
  EnforcementState state{50, false};
  EXPECT_FALSE(AccountChunk(state, 0, 50, kDefaultMaxChunkBytes));
  EXPECT_EQ(state.bytesRead, 50U);
}

TEST(EnforcementStateTest, CumulativeLimitExceeded) {
  EnforcementState state;
  EXPECT_FALSE(AccountChunk(state, 40, 50, kDefaultMaxChunkBytes));

  auto optError = AccountChunk(state, 40, 50, kDefaultMaxChunkBytes);
  ASSERT_TRUE(optError);
  EXPECT_EQ(*optError, SizeLimitError(SizeLimitError::BodyTooLarge{50, 80}));
  EXPECT_TRUE(state.hasViolated);
  // rejected bytes are not committed
  EXPECT_EQ(state.bytesRead, 40U);
}

TEST(EnforcementStateTest, ChunkCeilingCheckedFirst) {
  EnforcementState state;
  auto optError = AccountChunk(state, 17, 10, 16);
  ASSERT_TRUE(optError);
  EXPECT_EQ(*optError, SizeLimitError(SizeLimitError::ChunkTooLarge{16, 17}));
  EXPECT_TRUE(state.hasViolated);
  EXPECT_EQ(state.bytesRead, 0U);
}

TEST(EnforcementStateTest, ChunkAtCeilingIsAccepted) {
  EnforcementState state;
  EXPECT_FALSE(AccountChunk(state, 16, 100, 16));
  EXPECT_EQ(state.bytesRead, 16U);
}

TEST(EnforcementStateTest, Overflow) {
  static constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();

  EnforcementState state{kMax - 1U, false};
  auto optError = AccountChunk(state, 2, kMax, kMax);
  ASSERT_TRUE(optError);
  EXPECT_TRUE(optError->is<SizeLimitError::SizeOverflow>());
  EXPECT_EQ(optError->statusCode(), 400);
  EXPECT_TRUE(state.hasViolated);
  EXPECT_EQ(state.bytesRead, kMax - 1U);
}

TEST(EnforcementStateTest, NoOverflowUpToMax) {
  static constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();

  EnforcementState state{kMax - 1U, false};
  EXPECT_FALSE(AccountChunk(state, 1, kMax, kMax));
  EXPECT_EQ(state.bytesRead, kMax);
}

}  // namespace sizegate
