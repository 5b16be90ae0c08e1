#ifndef MONEY_FORMAT_CURRENCY_HPP
#define MONEY_FORMAT_CURRENCY_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "money/error.hpp"

namespace money::format {

// ----------------------------------------------------------------------------
// 貨幣與語系資料
// ----------------------------------------------------------------------------

/// @brief 貨幣顯示資訊
struct CurrencyInfo {
  std::string_view code;    ///< ISO 4217 代碼 (e.g. "USD")
  std::string_view symbol;  ///< 顯示符號 (e.g. "$")
  int digits;               ///< 小數位數 (minor unit 的位數)
};

/// @brief 顯示語系的數字格式
struct LocaleInfo {
  std::string_view name;   ///< 語系名稱 (e.g. "en_US")
  char group_separator;    ///< 千分位符號
  char decimal_separator;  ///< 小數點
  int group_size;          ///< 每組位數
};

inline constexpr CurrencyInfo USD{"USD", "$", 2};
inline constexpr CurrencyInfo EUR{"EUR", "€", 2};
inline constexpr CurrencyInfo GBP{"GBP", "£", 2};
inline constexpr CurrencyInfo JPY{"JPY", "¥", 0};

inline constexpr LocaleInfo EN_US{"en_US", ',', '.', 3};

/// @brief 查詢內建貨幣表
/// @param code ISO 4217 代碼
/// @return 貨幣資訊，找不到時回傳 money_errc::unknown_currency
///
[[nodiscard]] Result<CurrencyInfo> find_currency(std::string_view code) noexcept;

/// @brief 查詢顯示語系
/// @param name 語系名稱，目前僅支援 "en_US"
/// @return 語系資訊，不支援時回傳 money_errc::unsupported_locale
///
[[nodiscard]] Result<LocaleInfo> find_locale(std::string_view name) noexcept;

// ----------------------------------------------------------------------------
// 格式化
// ----------------------------------------------------------------------------

/// @brief 將 minor units 格式化為貨幣字串
/// @param minor_units 以該貨幣最小單位表示的金額 (USD 為 cents)
/// @details 格式範例 (en_US)："$1,000.00"、"-$10.00"、"¥1,500"
/// @note 全程以整數處理，不經過 double
/// @pre 0 <= currency.digits <= 18 且 locale.group_size > 0 (Debug assert)
///
[[nodiscard]] std::string format_currency(int64_t minor_units,
                                          const CurrencyInfo& currency,
                                          const LocaleInfo& locale);

/// @brief 依代碼與語系名稱格式化
/// @return 格式化字串，或 unknown_currency / unsupported_locale
///
[[nodiscard]] Result<std::string> format_currency(int64_t minor_units,
                                                  std::string_view code,
                                                  std::string_view locale);

}  // namespace money::format

#endif
