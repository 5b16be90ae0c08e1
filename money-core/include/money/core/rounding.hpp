#ifndef MONEY_CORE_ROUNDING_HPP
#define MONEY_CORE_ROUNDING_HPP

#include <cassert>
#include <cmath>
#include <cstdint>

namespace money::core {

// ======================
// 整數
// ======================

/// @brief 取絕對值 (以 uint64 表示，INT64_MIN 不會溢位)
[[nodiscard]] constexpr uint64_t magnitude(int64_t v) noexcept {
  return v < 0 ? uint64_t{0} - static_cast<uint64_t>(v)
               : static_cast<uint64_t>(v);
}

/// @brief 整數除法，商依 round-half-even 取整
/// @details 全程整數運算，不經過 double
/// @warning den 不可為 0；INT64_MIN / -1 需由呼叫端先行排除
[[nodiscard]] constexpr int64_t divide_half_even(int64_t num,
                                                 int64_t den) noexcept {
  assert(den != 0);
  assert(!(num == INT64_MIN && den == -1));

  int64_t quotient = num / den;
  int64_t remainder = num % den;
  if (remainder == 0) {
    return quotient;
  }

  // 比較 |r| 與 |den| - |r|，避免 2 * |r| 溢位
  uint64_t r = magnitude(remainder);
  uint64_t rest = magnitude(den) - r;
  int64_t step = ((num < 0) != (den < 0)) ? -1 : 1;

  if (r > rest || (r == rest && quotient % 2 != 0)) {
    quotient += step;
  }
  return quotient;
}

/// @brief 整數 floor 除法 (往負無限大截斷)
/// @warning den 不可為 0；INT64_MIN / -1 需由呼叫端先行排除
[[nodiscard]] constexpr int64_t divide_floor(int64_t num,
                                             int64_t den) noexcept {
  assert(den != 0);
  assert(!(num == INT64_MIN && den == -1));

  int64_t quotient = num / den;
  int64_t remainder = num % den;
  if (remainder != 0 && ((remainder < 0) != (den < 0))) {
    --quotient;
  }
  return quotient;
}

// ======================
// 浮點數
// ======================

/// @brief 四捨六入五成雙 (與目前的浮點捨入模式無關)
[[nodiscard]] inline double round_half_even(double x) noexcept {
  double rounded = std::round(x);  // half away from zero
  if (std::fabs(x - std::trunc(x)) == 0.5) {
    rounded = 2.0 * std::round(x / 2.0);
  }
  return rounded;
}

/// @brief 檢查 double 是否能無損轉為 int64 (NaN 與 inf 皆為 false)
[[nodiscard]] constexpr bool fits_int64(double v) noexcept {
  // 2^63 可被 double 精確表示
  return v >= -9223372036854775808.0 && v < 9223372036854775808.0;
}

}  // namespace money::core

#endif
