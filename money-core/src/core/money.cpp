#include "money/core/money.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <string>
#include <system_error>
#include <variant>

#include "money/core/error.hpp"
#include "money/core/rounding.hpp"
#include "money/error.hpp"
#include "money/format/currency.hpp"

namespace money::core {

static_assert(Money::CURRENCY_CODE == format::USD.code);
static_assert(Money::DISPLAY_LOCALE == format::EN_US.name);
static_assert(Money::MINOR_PER_MAJOR == 100 && format::USD.digits == 2);

namespace {

/// @brief 取出加減與比較可接受的整數運算元 (Money 取其金額)
Result<int64_t> integer_operand(const Value& value, const char* msg) noexcept {
  if (const auto* amount = std::get_if<int64_t>(&value)) {
    return *amount;
  }
  if (const auto* other = std::get_if<Money>(&value)) {
    return other->amount();
  }
  return money::fail(money_errc::invalid_operand, msg);
}

}  // namespace

// ----------------------------------------------------------------------------
// Named Constructors
// ----------------------------------------------------------------------------

Result<Money> Money::from(const Value& value) noexcept {
  if (const auto* amount = std::get_if<int64_t>(&value)) {
    return Money{*amount};
  }
  return money::fail(money_errc::invalid_amount, "Amount must be an integer");
}

Result<Money> Money::from_float(double amount) noexcept {
  if (!std::isfinite(amount)) {
    return money::fail(money_errc::invalid_amount,
                       "Amount must be a finite float");
  }

  double scaled = std::floor(amount * MINOR_PER_MAJOR);
  if (!fits_int64(scaled)) {
    return money::fail(money_errc::amount_overflow);
  }

  return Money{static_cast<int64_t>(scaled)};
}

Result<Money> Money::from_string(std::string_view text) {
  // 只保留數字與小數點 (負號、幣別符號、千分位皆移除)
  std::string digits;
  digits.reserve(text.size());
  for (char c : text) {
    if ((c >= '0' && c <= '9') || c == '.') {
      digits.push_back(c);
    }
  }

  const char* first = digits.data();
  const char* last = digits.data() + digits.size();

  double value = 0;
  auto [ptr, ec] =
      std::from_chars(first, last, value, std::chars_format::fixed);

  if (ec == std::errc::result_out_of_range) {
    return money::fail(money_errc::amount_overflow);
  }
  if (ec != std::errc{} || ptr != last) {
    return money::fail(money_errc::invalid_format,
                       "Expected a single decimal number");
  }

  return from_float(value);
}

Result<Money> Money::float_value(const Value& value) noexcept {
  if (const auto* amount = std::get_if<double>(&value)) {
    return from_float(*amount);
  }
  return money::fail(money_errc::invalid_amount, "Amount must be a float");
}

Result<Money> Money::string_value(const Value& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return from_string(std::string_view{*text});
  }
  return money::fail(money_errc::invalid_amount, "Amount must be a string");
}

Result<Money> Money::instance(const Value& value) const noexcept {
  return from(value);
}

// ----------------------------------------------------------------------------
// 檢查式算術
// ----------------------------------------------------------------------------

Result<Money> Money::add(const Value& other) const noexcept {
  int64_t rhs = TRY(integer_operand(other, "add() accepts Money or integer"));

  int64_t sum = 0;
  if (__builtin_add_overflow(amount_, rhs, &sum)) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{sum};
}

Result<Money> Money::subtract(const Value& other) const noexcept {
  int64_t rhs =
      TRY(integer_operand(other, "subtract() accepts Money or integer"));

  int64_t difference = 0;
  if (__builtin_sub_overflow(amount_, rhs, &difference)) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{difference};
}

Result<Money> Money::multiply(const Value& factor) const noexcept {
  if (const auto* scalar = std::get_if<int64_t>(&factor)) {
    int64_t product = 0;
    if (__builtin_mul_overflow(amount_, *scalar, &product)) {
      return money::fail(money_errc::amount_overflow);
    }
    return Money{product};
  }

  if (const auto* scalar = std::get_if<double>(&factor)) {
    if (!std::isfinite(*scalar)) {
      return money::fail(money_errc::invalid_operand,
                         "Factor must be finite");
    }
    double product = round_half_even(static_cast<double>(amount_) * *scalar);
    if (!fits_int64(product)) {
      return money::fail(money_errc::amount_overflow);
    }
    return Money{static_cast<int64_t>(product)};
  }

  return money::fail(money_errc::invalid_operand,
                     "multiply() accepts integer or float");
}

// ----------------------------------------------------------------------------
// 除法
// ----------------------------------------------------------------------------

Result<Money> Money::divide_rounded(int64_t divisor) const noexcept {
  if (divisor == 0) {
    return money::fail(money_errc::division_by_zero);
  }
  if (amount_ == INT64_MIN && divisor == -1) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{divide_half_even(amount_, divisor)};
}

Result<Money> Money::divide_rounded(double divisor) const noexcept {
  if (divisor == 0.0) {
    return money::fail(money_errc::division_by_zero);
  }
  if (std::isnan(divisor)) {
    return money::fail(money_errc::invalid_operand, "Divisor is NaN");
  }

  double quotient = round_half_even(static_cast<double>(amount_) / divisor);
  if (!fits_int64(quotient)) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{static_cast<int64_t>(quotient)};
}

Result<Money> Money::divide_floored(int64_t divisor) const noexcept {
  if (divisor == 0) {
    return money::fail(money_errc::division_by_zero);
  }
  if (amount_ == INT64_MIN && divisor == -1) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{divide_floor(amount_, divisor)};
}

Result<Money> Money::divide_floored(double divisor) const noexcept {
  if (divisor == 0.0) {
    return money::fail(money_errc::division_by_zero);
  }
  if (std::isnan(divisor)) {
    return money::fail(money_errc::invalid_operand, "Divisor is NaN");
  }

  double quotient = std::floor(static_cast<double>(amount_) / divisor);
  if (!fits_int64(quotient)) {
    return money::fail(money_errc::amount_overflow);
  }
  return Money{static_cast<int64_t>(quotient)};
}

Result<int64_t> Money::true_divide(const Money& other) const noexcept {
  if (other.amount_ == 0) {
    return money::fail(money_errc::division_by_zero);
  }
  if (amount_ == INT64_MIN && other.amount_ == -1) {
    return money::fail(money_errc::amount_overflow);
  }
  return divide_half_even(amount_, other.amount_);
}

Result<Quotient> Money::true_divide(const Value& other) const {
  if (const auto* divisor = std::get_if<int64_t>(&other)) {
    return Quotient{TRY(divide_rounded(*divisor))};
  }
  if (const auto* divisor = std::get_if<double>(&other)) {
    return Quotient{TRY(divide_rounded(*divisor))};
  }
  if (const auto* divisor = std::get_if<Money>(&other)) {
    return Quotient{TRY(true_divide(*divisor))};
  }
  return money::fail(money_errc::invalid_operand,
                     "true_divide() accepts Money, integer or float");
}

Result<Money> Money::floor_divide(const Money& other) const noexcept {
  return divide_floored(other.amount_);
}

Result<Money> Money::floor_divide(const Value& other) const noexcept {
  if (const auto* divisor = std::get_if<int64_t>(&other)) {
    return divide_floored(*divisor);
  }
  if (const auto* divisor = std::get_if<double>(&other)) {
    return divide_floored(*divisor);
  }
  if (const auto* divisor = std::get_if<Money>(&other)) {
    return floor_divide(*divisor);
  }
  return money::fail(money_errc::invalid_operand,
                     "floor_divide() accepts Money, integer or float");
}

// ----------------------------------------------------------------------------
// 比較
// ----------------------------------------------------------------------------

Result<bool> Money::equals(const Value& other) const noexcept {
  int64_t rhs =
      TRY(integer_operand(other, "Comparison accepts Money or integer"));
  return amount_ == rhs;
}

Result<std::strong_ordering> Money::compare(const Value& other) const noexcept {
  int64_t rhs =
      TRY(integer_operand(other, "Comparison accepts Money or integer"));
  return amount_ <=> rhs;
}

// ----------------------------------------------------------------------------
// 序列化
// ----------------------------------------------------------------------------

std::string Money::to_string() const {
  return format::format_currency(amount_, format::USD, format::EN_US);
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
  return os << money.to_string();
}

}  // namespace money::core
