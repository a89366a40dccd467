#pragma once

#include <cmath>
#include <iostream>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = (a);                                                                                           \
    const double _b = (b);                                                                                           \
    if (!(std::fabs(_a - _b) <= (eps))) {                                                                            \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b                     \
                << " (" << _a << " vs " << _b << ")\n";                                                              \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static int FinishTests(const char* name)
{
  if (g_failures == 0) {
    std::cout << name << ": OK\n";
    return 0;
  }

  std::cerr << name << ": FAILED (" << g_failures << ")\n";
  return 1;
}
