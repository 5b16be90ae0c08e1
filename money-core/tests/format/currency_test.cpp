#include "money/format/currency.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "money/core/error.hpp"

namespace money::format::test {

using core::money_errc;

// ----------------------------------------------------------------------------
// 查表
// ----------------------------------------------------------------------------

TEST(CurrencyTest, FindCurrency) {
  auto usd = find_currency("USD");
  ASSERT_TRUE(usd);
  EXPECT_EQ(usd->symbol, "$");
  EXPECT_EQ(usd->digits, 2);

  auto jpy = find_currency("JPY");
  ASSERT_TRUE(jpy);
  EXPECT_EQ(jpy->digits, 0);
}

TEST(CurrencyTest, FindCurrency_Unknown) {
  auto result = find_currency("XXX");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), money_errc::unknown_currency);

  // 大小寫需一致
  EXPECT_FALSE(find_currency("usd"));
}

TEST(CurrencyTest, FindLocale) {
  auto en_us = find_locale("en_US");
  ASSERT_TRUE(en_us);
  EXPECT_EQ(en_us->group_separator, ',');
  EXPECT_EQ(en_us->decimal_separator, '.');

  auto other = find_locale("de_DE");
  ASSERT_FALSE(other);
  EXPECT_EQ(other.error(), money_errc::unsupported_locale);
}

// ----------------------------------------------------------------------------
// 格式化
// ----------------------------------------------------------------------------

TEST(CurrencyTest, FormatUsd) {
  EXPECT_EQ(format_currency(1000, USD, EN_US), "$10.00");
  EXPECT_EQ(format_currency(100000, USD, EN_US), "$1,000.00");
  EXPECT_EQ(format_currency(0, USD, EN_US), "$0.00");
  EXPECT_EQ(format_currency(7, USD, EN_US), "$0.07");
  EXPECT_EQ(format_currency(-1000, USD, EN_US), "-$10.00");
}

TEST(CurrencyTest, FormatGroupingBoundaries) {
  EXPECT_EQ(format_currency(99999, USD, EN_US), "$999.99");
  EXPECT_EQ(format_currency(100000, USD, EN_US), "$1,000.00");
  EXPECT_EQ(format_currency(9999999, USD, EN_US), "$99,999.99");
  EXPECT_EQ(format_currency(100000000, USD, EN_US), "$1,000,000.00");
  EXPECT_EQ(format_currency(615059322, USD, EN_US), "$6,150,593.22");
}

TEST(CurrencyTest, FormatExtremes) {
  EXPECT_EQ(format_currency(INT64_MIN, USD, EN_US),
            "-$92,233,720,368,547,758.08");
  EXPECT_EQ(format_currency(INT64_MAX, USD, EN_US),
            "$92,233,720,368,547,758.07");
}

TEST(CurrencyTest, FormatOtherCurrencies) {
  EXPECT_EQ(format_currency(1500, JPY, EN_US), "¥1,500");
  EXPECT_EQ(format_currency(1000, GBP, EN_US), "£10.00");
  EXPECT_EQ(format_currency(-250, EUR, EN_US), "-€2.50");
}

TEST(CurrencyTest, FormatMaxDigits) {
  constexpr CurrencyInfo fine{"XTS", "T", 18};
  EXPECT_EQ(format_currency(1, fine, EN_US), "T0.000000000000000001");
  EXPECT_EQ(format_currency(INT64_MIN, fine, EN_US),
            "-T9.223372036854775808");
}

// 非法的 CurrencyInfo / LocaleInfo 由 Debug assert 擋下
TEST(CurrencyDeathTest, FormatRejectsInvalidLayout) {
#ifdef NDEBUG
  GTEST_SKIP() << "assert disabled in release build";
#else
  constexpr LocaleInfo no_grouping{"xx", ',', '.', 0};
  EXPECT_DEATH((void)format_currency(100000, USD, no_grouping), "group_size");

  constexpr CurrencyInfo too_precise{"XTS", "T", 19};
  EXPECT_DEATH((void)format_currency(100000, too_precise, EN_US), "digits");
#endif
}

TEST(CurrencyTest, FormatByName) {
  auto text = format_currency(100000, "USD", "en_US");
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, "$1,000.00");

  auto bad_currency = format_currency(100, "ABC", "en_US");
  ASSERT_FALSE(bad_currency);
  EXPECT_EQ(bad_currency.error(), money_errc::unknown_currency);

  auto bad_locale = format_currency(100, "USD", "fr_FR");
  ASSERT_FALSE(bad_locale);
  EXPECT_EQ(bad_locale.error(), money_errc::unsupported_locale);
}

}  // namespace money::format::test
