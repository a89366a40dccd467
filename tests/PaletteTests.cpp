#include "color.hpp"
#include "color_metrics.hpp"
#include "hsv.hpp"
#include "monochromatic.hpp"
#include "palette_sort.hpp"

#include "lite_test.hpp"

#include <string>
#include <vector>

using Pal::Color;

static const std::vector<Color> kPalette = {
  {200, 30, 30}, {10, 10, 10}, {30, 200, 60}, {250, 250, 250}, {40, 40, 180}, {128, 128, 128}, {255, 200, 0},
};

static void TestSortDirections()
{
  using namespace Pal;

  const char* names[] = {"luminance", "brightness", "hue", "saturation", "value"};
  for (const char* name : names) {
    metric_fn metric = metric_by_name(name);
    ASSERT_TRUE(metric != nullptr);

    const std::vector<Color> up = sort_colors(kPalette, true, metric);
    ASSERT_TRUE(up.size() == kPalette.size());
    for (size_t i = 1; i < up.size(); ++i) {
      EXPECT_TRUE(metric(up[i - 1]) <= metric(up[i]));
    }

    const std::vector<Color> down = sort_colors(kPalette, false, metric);
    ASSERT_TRUE(down.size() == kPalette.size());
    for (size_t i = 1; i < down.size(); ++i) {
      EXPECT_TRUE(metric(down[i - 1]) >= metric(down[i]));
    }
  }
}

static void TestSortLeavesInputAlone()
{
  using namespace Pal;

  std::vector<Color> palette = kPalette;
  const std::vector<Color> sorted = sort_colors(palette, true, luminance);
  EXPECT_EQ(palette, kPalette);
  EXPECT_EQ(sorted.front(), (Color{10, 10, 10}));
  EXPECT_EQ(sorted.back(), (Color{250, 250, 250}));

  sort_colors_inplace(palette, false, luminance);
  EXPECT_EQ(palette, sort_colors(kPalette, false, luminance));
  EXPECT_EQ(palette.front(), (Color{250, 250, 250}));
}

static void TestSortIsStable()
{
  using namespace Pal;

  // All achromatic, so every hue is 0 and the order must survive both ways.
  const std::vector<Color> greys = {{10, 10, 10}, {200, 200, 200}, {90, 90, 90}};
  EXPECT_EQ(sort_colors(greys, true, hue), greys);
  EXPECT_EQ(sort_colors(greys, false, hue), greys);

  const std::vector<Color> mixed = {{0, 0, 255}, {10, 10, 10}, {255, 0, 0}, {200, 200, 200}};
  const std::vector<Color> expected = {{10, 10, 10}, {255, 0, 0}, {200, 200, 200}, {0, 0, 255}};
  EXPECT_EQ(sort_colors(mixed, true, hue), expected);
}

static void TestMetricByName()
{
  using namespace Pal;

  EXPECT_TRUE(metric_by_name("luminance") == &luminance);
  EXPECT_TRUE(metric_by_name("value") == &value);
  EXPECT_TRUE(metric_by_name("Luminance") == nullptr);
  EXPECT_TRUE(metric_by_name("distance") == nullptr);
  EXPECT_TRUE(metric_by_name("") == nullptr);
}

static void TestMonochromaticShape()
{
  using namespace Pal;

  for (size_t step = 0; step <= 6; ++step) {
    for (const Color& c : kPalette) {
      const std::vector<Color> gradient = monochromatic_colors(c, step);
      ASSERT_TRUE(gradient.size() == 2 * (step + 1) + 1);
      EXPECT_EQ(gradient[step + 1], hsv_to_rgb(to_hsv(c)));
      EXPECT_EQ(gradient.front(), (Color{255, 255, 255}));
      EXPECT_EQ(gradient.back(), (Color{0, 0, 0}));
    }
  }

  EXPECT_EQ(monochromatic_colors(Color{255, 0, 0}).size(), (size_t)9);
}

static void TestMonochromaticRed()
{
  using namespace Pal;

  const std::vector<Color> expected = {
    {255, 255, 255}, {255, 191, 191}, {255, 128, 128}, {255, 64, 64},
    {255, 0, 0},
    {191, 0, 0}, {128, 0, 0}, {64, 0, 0}, {0, 0, 0},
  };
  EXPECT_EQ(monochromatic_colors(Color{255, 0, 0}, 3), expected);
}

static void TestMonochromaticZeroStep()
{
  using namespace Pal;

  const std::vector<Color> gradient = monochromatic_colors(Color{0, 0, 255}, 0);
  ASSERT_TRUE(gradient.size() == 3);
  EXPECT_EQ(gradient[0], (Color{255, 255, 255}));
  EXPECT_EQ(gradient[1], (Color{0, 0, 255}));
  EXPECT_EQ(gradient[2], (Color{0, 0, 0}));

  // Pure black has no defined saturation; it still expands.
  const std::vector<Color> black = monochromatic_colors(Color{0, 0, 0}, 2);
  ASSERT_TRUE(black.size() == 7);
  EXPECT_EQ(black[3], (Color{0, 0, 0}));
}

int main()
{
  TestSortDirections();
  TestSortLeavesInputAlone();
  TestSortIsStable();
  TestMetricByName();
  TestMonochromaticShape();
  TestMonochromaticRed();
  TestMonochromaticZeroStep();

  return FinishTests("palette_sort_mono_tests");
}
