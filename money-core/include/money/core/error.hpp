#ifndef MONEY_CORE_ERROR_HPP
#define MONEY_CORE_ERROR_HPP

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace money::core {

/// @brief Money 相關錯誤碼
enum class money_errc : uint8_t {
  invalid_amount = 1,  ///< 建構輸入型別錯誤 (需要整數卻收到其他型別)
  invalid_operand,     ///< 運算元型別不被該運算接受
  division_by_zero,    ///< 除數 (或除數 Money 的金額) 為零
  amount_overflow,     ///< 金額超出 int64 範圍
  invalid_format,      ///< 貨幣字串無法解析為十進位數
  unknown_currency,    ///< 貨幣代碼不在內建表中
  unsupported_locale,  ///< 不支援的顯示語系
};

const std::error_category& money_category() noexcept;

std::error_code make_error_code(money_errc ec) noexcept;

}  // namespace money::core

template <>
struct std::is_error_code_enum<money::core::money_errc> : std::true_type {};

#endif
