#include "money/core/rounding.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace money::core::test {

static_assert(divide_half_even(25, 10) == 2);
static_assert(divide_floor(-7, 2) == -4);
static_assert(magnitude(INT64_MIN) == uint64_t{1} << 63);

TEST(RoundingTest, DivideHalfEven_Ties) {
  EXPECT_EQ(divide_half_even(5, 2), 2);     // 2.5
  EXPECT_EQ(divide_half_even(7, 2), 4);     // 3.5
  EXPECT_EQ(divide_half_even(-5, 2), -2);   // -2.5
  EXPECT_EQ(divide_half_even(-7, 2), -4);   // -3.5
  EXPECT_EQ(divide_half_even(5, -2), -2);   // -2.5
  EXPECT_EQ(divide_half_even(-5, -2), 2);   // 2.5
  EXPECT_EQ(divide_half_even(1050, 100), 10);
  EXPECT_EQ(divide_half_even(1150, 100), 12);
}

TEST(RoundingTest, DivideHalfEven_NonTies) {
  EXPECT_EQ(divide_half_even(1000, 3), 333);
  EXPECT_EQ(divide_half_even(2000, 3), 667);
  EXPECT_EQ(divide_half_even(-2000, 3), -667);
  EXPECT_EQ(divide_half_even(1051, 100), 11);
  EXPECT_EQ(divide_half_even(1049, 100), 10);
  EXPECT_EQ(divide_half_even(0, 7), 0);
  EXPECT_EQ(divide_half_even(42, 1), 42);
}

TEST(RoundingTest, DivideHalfEven_Extremes) {
  // |r| 與 |den| 接近 INT64 極值時不可溢位
  EXPECT_EQ(divide_half_even(INT64_MAX, INT64_MAX), 1);
  EXPECT_EQ(divide_half_even(INT64_MIN, INT64_MAX), -1);
  EXPECT_EQ(divide_half_even(INT64_MAX, INT64_MIN), -1);
  EXPECT_EQ(divide_half_even(INT64_MIN, 2), INT64_MIN / 2);
  EXPECT_EQ(divide_half_even(INT64_MAX, 2), INT64_MAX / 2 + 1);  // x.5, 奇數進位
}

TEST(RoundingTest, DivideFloor) {
  EXPECT_EQ(divide_floor(7, 2), 3);
  EXPECT_EQ(divide_floor(-7, 2), -4);
  EXPECT_EQ(divide_floor(7, -2), -4);
  EXPECT_EQ(divide_floor(-7, -2), 3);
  EXPECT_EQ(divide_floor(-6, 2), -3);
  EXPECT_EQ(divide_floor(0, -5), 0);
}

TEST(RoundingTest, RoundHalfEven_Double) {
  EXPECT_DOUBLE_EQ(round_half_even(0.5), 0.0);
  EXPECT_DOUBLE_EQ(round_half_even(1.5), 2.0);
  EXPECT_DOUBLE_EQ(round_half_even(2.5), 2.0);
  EXPECT_DOUBLE_EQ(round_half_even(-0.5), 0.0);
  EXPECT_DOUBLE_EQ(round_half_even(-1.5), -2.0);
  EXPECT_DOUBLE_EQ(round_half_even(-2.5), -2.0);
  EXPECT_DOUBLE_EQ(round_half_even(1000.9), 1001.0);
  EXPECT_DOUBLE_EQ(round_half_even(2.4999), 2.0);
  EXPECT_DOUBLE_EQ(round_half_even(-2.5001), -3.0);
  EXPECT_DOUBLE_EQ(round_half_even(1e18), 1e18);
}

TEST(RoundingTest, FitsInt64) {
  EXPECT_TRUE(fits_int64(0.0));
  EXPECT_TRUE(fits_int64(-9223372036854775808.0));
  EXPECT_FALSE(fits_int64(9223372036854775808.0));
  EXPECT_FALSE(fits_int64(std::numeric_limits<double>::quiet_NaN()));
  EXPECT_FALSE(fits_int64(std::numeric_limits<double>::infinity()));
  EXPECT_FALSE(fits_int64(-std::numeric_limits<double>::infinity()));
}

}  // namespace money::core::test
