#include "color.hpp"
#include "pixel_sampler.hpp"
#include "swatch.hpp"

#include "lite_test.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using Pal::Color;

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void TestSamplePixelsBuffer()
{
  // 2x2 RGBA, the third pixel is transparent.
  const std::vector<std::uint8_t> rgba = {
    255, 0, 0, 255,
    0, 255, 0, 255,
    0, 0, 255, 0,
    9, 8, 7, 200,
  };

  std::vector<Color> out;
  sample_pixels(rgba.data(), 2, 2, out);
  ASSERT_TRUE(out.size() == 3);
  EXPECT_EQ(out[0], (Color{255, 0, 0}));
  EXPECT_EQ(out[1], (Color{0, 255, 0}));
  EXPECT_EQ(out[2], (Color{9, 8, 7}));

  std::vector<Color> strided;
  sample_pixels(rgba.data(), 2, 2, strided, 2);
  ASSERT_TRUE(strided.size() == 1);
  EXPECT_EQ(strided[0], (Color{255, 0, 0}));

  // Appends instead of replacing; a stride of 0 behaves like 1.
  sample_pixels(rgba.data(), 2, 2, strided, 0);
  EXPECT_EQ(strided.size(), (size_t)4);
}

static void TestSwatchRoundTrip()
{
  const fs::path base = MakeTempPath("palettetools_swatch");
  const fs::path file = base / "nested" / "swatch.png";

  const std::vector<Color> palette = {{255, 0, 0}, {0, 128, 255}, {12, 34, 56}};
  ASSERT_TRUE(write_swatch(file, palette, 4));
  EXPECT_TRUE(fs::exists(file));

  std::vector<Color> sampled;
  ASSERT_TRUE(sample_image(file, sampled));
  ASSERT_TRUE(sampled.size() == 4 * 4 * palette.size());

  // First row: four pixels per cell, left to right.
  for (size_t x = 0; x < 4 * palette.size(); ++x) {
    EXPECT_EQ(sampled[x], palette[x / 4]);
  }

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestSwatchRejectsBadInput()
{
  const fs::path base = MakeTempPath("palettetools_swatch_bad");

  EXPECT_FALSE(write_swatch(base / "empty.png", std::vector<Color>{}));
  EXPECT_FALSE(write_swatch(base / "tiny.png", std::vector<Color>{{1, 2, 3}}, 0));
  EXPECT_FALSE(fs::exists(base / "empty.png"));

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestSampleMissingImage()
{
  std::vector<Color> out;
  EXPECT_FALSE(sample_image(MakeTempPath("palettetools_missing") / "nope.png", out));
  EXPECT_TRUE(out.empty());
}

int main()
{
  TestSamplePixelsBuffer();
  TestSwatchRoundTrip();
  TestSwatchRejectsBadInput();
  TestSampleMissingImage();

  return FinishTests("paletteio_tests");
}
