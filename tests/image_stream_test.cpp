#include "gtest/gtest.h"

#include "imgstream/core/io/image_stream.hpp"

#include <limits>

namespace imgstream::test {

TEST(ClampSeek, OriginsSelectBase)
{
  EXPECT_EQ(clamp_seek(3, 2, SeekOrigin::kBegin, 10), 2);
  EXPECT_EQ(clamp_seek(3, 2, SeekOrigin::kCurrent, 10), 5);
  EXPECT_EQ(clamp_seek(3, -2, SeekOrigin::kEnd, 10), 8);
}

TEST(ClampSeek, ClampsToBounds)
{
  EXPECT_EQ(clamp_seek(0, 1'000'000, SeekOrigin::kBegin, 7), 7);
  EXPECT_EQ(clamp_seek(5, -1'000'000, SeekOrigin::kBegin, 7), 0);
  EXPECT_EQ(clamp_seek(5, 10, SeekOrigin::kEnd, 7), 7);
  EXPECT_EQ(clamp_seek(2, -3, SeekOrigin::kCurrent, 7), 0);
}

TEST(ClampSeek, EndPositionIsReachable)
{
  EXPECT_EQ(clamp_seek(0, 0, SeekOrigin::kEnd, 4), 4);
  EXPECT_EQ(clamp_seek(3, 1, SeekOrigin::kCurrent, 4), 4);
}

TEST(ClampSeek, EmptyStreamAlwaysZero)
{
  EXPECT_EQ(clamp_seek(0, 5, SeekOrigin::kBegin, 0), 0);
  EXPECT_EQ(clamp_seek(0, -5, SeekOrigin::kEnd, 0), 0);
}

TEST(ClampSeek, ExtremeOffsetsSaturate)
{
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  EXPECT_EQ(clamp_seek(5, kMax, SeekOrigin::kCurrent, 9), 9);
  EXPECT_EQ(clamp_seek(5, kMin, SeekOrigin::kCurrent, 9), 0);
  EXPECT_EQ(clamp_seek(0, kMax, SeekOrigin::kEnd, 9), 9);
}

}  // namespace imgstream::test
