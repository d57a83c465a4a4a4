#include "gtest/gtest.h"

#include "imgstream/core/io/image.hpp"

#include <limits>
#include <utility>

namespace imgstream::test {

namespace {

Image counted_image(int& releases)
{
  static std::uint8_t pixels[4] = {1, 2, 3, 4};
  ImageInfo info;
  info.width = 2;
  info.height = 2;
  info.channels = 1;
  info.stride = 2;
  return Image(info, pixels, [&releases]() { ++releases; });
}

}  // namespace

TEST(Image, ReleasesExactlyOnceOnDestruction)
{
  int releases = 0;
  {
    Image img = counted_image(releases);
    EXPECT_FALSE(img.empty());
    EXPECT_EQ(img.size_bytes(), 4u);
  }
  EXPECT_EQ(releases, 1);
}

TEST(Image, MoveTransfersOwnership)
{
  int releases = 0;
  {
    Image a = counted_image(releases);
    Image b = std::move(a);
    EXPECT_TRUE(a.empty());  // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(a.size_bytes(), 0u);
    EXPECT_FALSE(b.empty());
    EXPECT_EQ(releases, 0);
  }
  EXPECT_EQ(releases, 1);
}

TEST(Image, MoveAssignReleasesPrevious)
{
  int first = 0;
  int second = 0;
  Image a = counted_image(first);
  Image b = counted_image(second);

  a = std::move(b);
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 0);

  a = Image{};
  EXPECT_EQ(second, 1);
}

TEST(Image, AllocateIsZeroFilledAndPacked)
{
  auto r = Image::allocate(3, 2, 4, 2);
  ASSERT_TRUE(r.ok()) << r.status().message();
  Image img = r.take_value();
  ASSERT_FALSE(img.empty());
  EXPECT_EQ(img.info().stride, 3u * 4u * 2u);
  EXPECT_EQ(img.size_bytes(), 3u * 4u * 2u * 2u);
  for (std::size_t i = 0; i < img.size_bytes(); ++i) EXPECT_EQ(img.data()[i], 0);
  EXPECT_EQ(img.row(1), img.data() + img.info().stride);
}

TEST(Image, AllocateRejectsNegativeSizes)
{
  EXPECT_EQ(Image::allocate(-1, 2, 1).status().code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(Image::allocate(2, 2, 1, 0).status().code(), Status::Code::kInvalidArgument);
}

TEST(Image, AllocateRejectsOverflowingSize)
{
  const int big = std::numeric_limits<int>::max();
  auto r = Image::allocate(big, big, big, big);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST(Image, AllocatedBufferOutlivesMovesUntilReleased)
{
  auto r = Image::allocate(4, 1, 1);
  ASSERT_TRUE(r.ok());
  Image a = r.take_value();
  a.data()[3] = 7;
  Image b = std::move(a);
  EXPECT_EQ(b.data()[3], 7);
  EXPECT_EQ(b.size_bytes(), 4u);
}

TEST(Image, DefaultIsEmpty)
{
  Image img;
  EXPECT_TRUE(img.empty());
  EXPECT_EQ(img.size_bytes(), 0u);
  EXPECT_EQ(img.width(), 0);
}

}  // namespace imgstream::test
