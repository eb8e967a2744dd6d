#include <vigil/core/image.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vc = vigil::core;

TEST(Image, DefaultIsEmptyAndInvalid) {
  vc::Image img;
  EXPECT_TRUE(img.empty());
  EXPECT_EQ(img.width(), 0u);
  EXPECT_EQ(img.height(), 0u);
  EXPECT_EQ(img.format(), vc::PixelFormat::Unknown);
  EXPECT_FALSE(img.valid());
}

TEST(Image, ConstructWithBuffer) {
  std::vector<std::byte> buf(100);
  vc::Image img(10, 10, vc::PixelFormat::Grayscale8, std::move(buf));
  EXPECT_FALSE(img.empty());
  EXPECT_EQ(img.width(), 10u);
  EXPECT_EQ(img.height(), 10u);
  EXPECT_EQ(img.size_bytes(), 100u);
  EXPECT_TRUE(img.valid());
}

TEST(Image, ShortBufferIsInvalid) {
  std::vector<std::byte> buf(10 * 10 * 3 - 1);
  vc::Image img(10, 10, vc::PixelFormat::RGB8, std::move(buf));
  EXPECT_FALSE(img.valid());
}

TEST(Image, ZeroDimensionIsInvalid) {
  vc::Image img(0, 10, vc::PixelFormat::RGB8, std::vector<std::byte>(30));
  EXPECT_FALSE(img.valid());
}

TEST(Image, UnknownFormatIsInvalid) {
  vc::Image img(2, 2, vc::PixelFormat::Unknown, std::vector<std::byte>(16));
  EXPECT_FALSE(img.valid());
}

TEST(Image, MinBytes) {
  EXPECT_EQ(vc::Image::min_bytes(640, 480, vc::PixelFormat::Grayscale8), 640u * 480u);
  EXPECT_EQ(vc::Image::min_bytes(640, 480, vc::PixelFormat::RGB8), 640u * 480u * 3u);
  EXPECT_EQ(vc::Image::min_bytes(640, 480, vc::PixelFormat::BGRA8), 640u * 480u * 4u);
  EXPECT_EQ(vc::Image::min_bytes(640, 480, vc::PixelFormat::Unknown), 0u);
}

TEST(Image, DataSpanAllowsWrite) {
  vc::Image img(2, 1, vc::PixelFormat::Grayscale8, std::vector<std::byte>(2));
  img.data()[1] = std::byte{200};
  const vc::Image& cimg = img;
  EXPECT_EQ(cimg.data()[1], std::byte{200});
}
