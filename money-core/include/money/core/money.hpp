#ifndef MONEY_CORE_MONEY_HPP
#define MONEY_CORE_MONEY_HPP

#include <fmt/format.h>

#include <cassert>
#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "money/core/error.hpp"
#include "money/core/rounding.hpp"
#include "money/error.hpp"

namespace money::core {

class Money;

/// @brief 執行期才知道型別的金額或運算元
/// @details 各運算依自己的型別許可表檢查，不合法時回傳錯誤碼
using Value = std::variant<int64_t, double, std::string, Money>;

/// @brief true_divide(const Value&) 的結果
/// @details 除以數字得到 Money，除以 Money 得到純整數
using Quotient = std::variant<Money, int64_t>;

/// @brief 可無損轉為 int64 的整數金額
/// @details bool 與 64-bit 無號整數除外 (UINT64_MAX 會變成 -1)
template <typename T>
concept MinorUnits =
    std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool> &&
    (std::signed_integral<T> || sizeof(T) < sizeof(int64_t));

/// @brief 不能當作整數金額的算術型別 (浮點數、bool、64-bit 無號整數)
template <typename T>
concept NonMinorUnits = std::is_arithmetic_v<T> && !MinorUnits<T>;

/// @brief 乘除法接受的數值 (整數或浮點數)
template <typename T>
concept Factor = MinorUnits<T> || std::floating_point<T>;

/// @brief 強類型貨幣金額 (Fowler's Money pattern)
/// @details
/// 內部以 minor units 儲存 (USD 為 cents)，所有運算皆回傳新物件。
/// 運算子為不檢查的快速路徑 (溢位僅於 Debug assert)；
/// add / subtract / multiply / *_divide / compare 等具名方法會檢查並回傳錯誤碼。
///
/// 型別許可表：
/// - 加減與比較：Money 或整數，不接受浮點數
/// - 乘法：整數或浮點數，不接受 Money
/// - 除法：Money、整數或浮點數
/// - bool 與 64-bit 無號整數不視為整數金額，一律於編譯期拒絕
///
class Money {
 private:
  int64_t amount_;

  explicit constexpr Money(int64_t amount) noexcept : amount_(amount) {}

  [[nodiscard]] Result<Money> divide_rounded(int64_t divisor) const noexcept;
  [[nodiscard]] Result<Money> divide_rounded(double divisor) const noexcept;
  [[nodiscard]] Result<Money> divide_floored(int64_t divisor) const noexcept;
  [[nodiscard]] Result<Money> divide_floored(double divisor) const noexcept;

  [[nodiscard]] static Result<Money> float_value(const Value& value) noexcept;
  [[nodiscard]] static Result<Money> string_value(const Value& value);

 public:
  static constexpr int64_t MINOR_PER_MAJOR = 100;  // 1 dollar = 100 cents
  static constexpr std::string_view CURRENCY_CODE = "USD";
  static constexpr std::string_view DISPLAY_LOCALE = "en_US";

  // ======================
  // Named Constructors
  // ======================
  static constexpr Money from_minor(int64_t amount) noexcept {
    return Money{amount};
  }
  template <NonMinorUnits T>
  static Money from_minor(T) = delete;

  /// @brief 從執行期型別建立，只接受整數
  /// @return Money 或 money_errc::invalid_amount
  [[nodiscard]] static Result<Money> from(const Value& value) noexcept;

  /// @brief 從主單位浮點數建立，floor(amount * 100)
  /// @note 使用 floor 而非 round-half-even，與 round() 不對稱
  /// @return Money、invalid_amount (非有限值) 或 amount_overflow
  [[nodiscard]] static Result<Money> from_float(double amount) noexcept;
  template <std::integral I>
  static Result<Money> from_float(I) = delete;

  /// @brief 執行期型別版本，只接受 double
  /// @details 限定參數恰為 Value，避免整數或字串隱式轉成 Value
  /// @return Money、invalid_amount 或 amount_overflow
  template <std::same_as<Value> V>
  [[nodiscard]] static Result<Money> from_float(const V& value) noexcept {
    return float_value(value);
  }

  /// @brief 從貨幣字串建立 (e.g. "$6,150,593.22")
  /// @details 移除所有非數字與非小數點字元後以十進位解析，再交給 from_float
  /// @warning 負號也會被移除，"-$5.00" 會解析為 500
  [[nodiscard]] static Result<Money> from_string(std::string_view text);

  /// @brief 執行期型別版本，只接受 std::string
  /// @return Money、invalid_amount (非字串) 或 from_string 的錯誤
  template <std::same_as<Value> V>
  [[nodiscard]] static Result<Money> from_string(const V& value) {
    return string_value(value);
  }

  /// @brief 以給定金額建立同型別的新物件
  [[nodiscard]] constexpr Money instance(int64_t amount) const noexcept {
    return Money{amount};
  }
  template <NonMinorUnits T>
  Money instance(T) const = delete;
  Money instance(const Money&) const = delete;
  [[nodiscard]] Result<Money> instance(const Value& value) const noexcept;

  // ======================
  // 特殊值
  // ======================
  static constexpr Money zero() noexcept { return Money{0}; }
  static constexpr Money max() noexcept { return Money{INT64_MAX}; }
  static constexpr Money min() noexcept { return Money{-INT64_MAX}; }

  // ======================
  // 取值函數
  // ======================
  [[nodiscard]] constexpr int64_t amount() const noexcept { return amount_; }

  [[nodiscard]] static constexpr std::string_view currency() noexcept {
    return CURRENCY_CODE;
  }

  [[nodiscard]] constexpr int64_t to_integer() const noexcept {
    return amount_;
  }

  /// @brief 主單位浮點數 (顯示用，有精度損失)
  [[nodiscard]] constexpr double to_float() const noexcept {
    return static_cast<double>(amount_) / MINOR_PER_MAJOR;
  }

  explicit constexpr operator int64_t() const noexcept { return amount_; }
  explicit constexpr operator double() const noexcept { return to_float(); }

  // ======================
  // 算術運算
  // ======================
  [[nodiscard]] constexpr Money operator+(const Money& other) const noexcept {
    return *this + other.amount_;
  }

  [[nodiscard]] constexpr Money operator+(int64_t amount) const noexcept {
    assert((amount > 0 && amount_ <= INT64_MAX - amount) ||
           (amount <= 0 && amount_ >= INT64_MIN - amount));
    return Money{amount_ + amount};
  }
  template <NonMinorUnits T>
  Money operator+(T) const = delete;

  [[nodiscard]] constexpr Money operator-(const Money& other) const noexcept {
    return *this - other.amount_;
  }

  [[nodiscard]] constexpr Money operator-(int64_t amount) const noexcept {
    assert((amount < 0 && amount_ <= INT64_MAX + amount) ||
           (amount >= 0 && amount_ >= INT64_MIN + amount));
    return Money{amount_ - amount};
  }
  template <NonMinorUnits T>
  Money operator-(T) const = delete;

  /// @brief 乘法，浮點數乘積以 round-half-even 取整
  /// @pre 乘積必須落在 int64 範圍內且 factor 為有限值
  /// @warning 不檢查的快速路徑：Release 下 assert 被移除，超出範圍的浮點乘積
  ///          轉 int64 為未定義行為 (e.g. m * 1e300)。
  ///          輸入不可信時改用 multiply()，會回傳 amount_overflow / invalid_operand
  template <Factor T>
  [[nodiscard]] Money operator*(T factor) const noexcept {
    if constexpr (std::floating_point<T>) {
      double product =
          round_half_even(static_cast<double>(amount_) * factor);
      assert(fits_int64(product));
      return Money{static_cast<int64_t>(product)};
    } else {
      int64_t product = 0;
      [[maybe_unused]] bool overflow = __builtin_mul_overflow(
          amount_, static_cast<int64_t>(factor), &product);
      assert(!overflow);
      return Money{product};
    }
  }

  [[nodiscard]] constexpr Money negate() const noexcept {
    assert(amount_ != INT64_MIN);
    return Money{-amount_};
  }

  [[nodiscard]] constexpr Money plus() const noexcept {
    return Money{+amount_};
  }

  [[nodiscard]] constexpr Money absolute_value() const noexcept {
    return amount_ < 0 ? negate() : *this;
  }

  [[nodiscard]] constexpr Money operator-() const noexcept { return negate(); }
  [[nodiscard]] constexpr Money operator+() const noexcept { return plus(); }

  /// @brief 四捨六入五成雙到整數主單位 (結果必為 100 的倍數)
  /// @details 1050 -> 1000, 1051 -> 1100, 1150 -> 1200
  [[nodiscard]] constexpr Money round() const noexcept {
    return Money{divide_half_even(amount_, MINOR_PER_MAJOR) * MINOR_PER_MAJOR};
  }

  // ======================
  // 檢查式算術 (執行期型別)
  // ======================
  /// @brief 加法，接受 Money 或整數
  /// @return invalid_operand (浮點數、字串) 或 amount_overflow
  [[nodiscard]] Result<Money> add(const Value& other) const noexcept;

  /// @brief 減法，接受 Money 或整數
  [[nodiscard]] Result<Money> subtract(const Value& other) const noexcept;

  /// @brief 乘法，接受整數或浮點數 (不接受 Money)
  [[nodiscard]] Result<Money> multiply(const Value& factor) const noexcept;

  // ======================
  // 除法
  // ======================
  /// @brief 除以數字，商以 round-half-even 取整
  /// @return Money 或 division_by_zero
  template <Factor T>
  [[nodiscard]] Result<Money> true_divide(T divisor) const noexcept {
    if constexpr (std::floating_point<T>) {
      return divide_rounded(static_cast<double>(divisor));
    } else {
      return divide_rounded(static_cast<int64_t>(divisor));
    }
  }

  /// @brief 兩筆金額相除
  /// @note 回傳純整數而非 Money，與 floor_divide(const Money&) 不同
  [[nodiscard]] Result<int64_t> true_divide(const Money& other) const noexcept;

  [[nodiscard]] Result<Quotient> true_divide(const Value& other) const;

  /// @brief floor 除法 (往負無限大截斷)
  template <Factor T>
  [[nodiscard]] Result<Money> floor_divide(T divisor) const noexcept {
    if constexpr (std::floating_point<T>) {
      return divide_floored(static_cast<double>(divisor));
    } else {
      return divide_floored(static_cast<int64_t>(divisor));
    }
  }

  /// @brief 兩筆金額 floor 相除
  /// @note 回傳 Money，與 true_divide(const Money&) 不同
  [[nodiscard]] Result<Money> floor_divide(const Money& other) const noexcept;

  [[nodiscard]] Result<Money> floor_divide(const Value& other) const noexcept;

  // ======================
  // 比較運算
  // ======================
  // 只比較金額，不比較幣別
  [[nodiscard]] constexpr bool operator==(const Money& other) const noexcept {
    return amount_ == other.amount_;
  }

  [[nodiscard]] constexpr bool operator!=(const Money& other) const noexcept {
    return amount_ != other.amount_;
  }

  [[nodiscard]] constexpr bool operator<(const Money& other) const noexcept {
    return amount_ < other.amount_;
  }

  [[nodiscard]] constexpr bool operator<=(const Money& other) const noexcept {
    return amount_ <= other.amount_;
  }

  [[nodiscard]] constexpr bool operator>(const Money& other) const noexcept {
    return amount_ > other.amount_;
  }

  [[nodiscard]] constexpr bool operator>=(const Money& other) const noexcept {
    return amount_ >= other.amount_;
  }

  // 與整數比較，其餘運算子由編譯器改寫產生
  [[nodiscard]] constexpr bool operator==(int64_t amount) const noexcept {
    return amount_ == amount;
  }

  [[nodiscard]] constexpr std::strong_ordering operator<=>(
      int64_t amount) const noexcept {
    return amount_ <=> amount;
  }

  template <NonMinorUnits T>
  bool operator==(T) const = delete;
  template <NonMinorUnits T>
  std::strong_ordering operator<=>(T) const = delete;

  /// @brief 相等檢查，接受 Money 或整數
  [[nodiscard]] Result<bool> equals(const Value& other) const noexcept;

  /// @brief 三向比較，接受 Money 或整數
  [[nodiscard]] Result<std::strong_ordering> compare(
      const Value& other) const noexcept;

  // ======================
  // 序列化
  // ======================
  /// @brief 以固定幣別與顯示語系格式化 (e.g. "$1,000.00")
  [[nodiscard]] std::string to_string() const;
};

// ======================
// 反向運算
// ======================
[[nodiscard]] constexpr Money operator+(int64_t amount,
                                        const Money& money) noexcept {
  return money + amount;
}
template <NonMinorUnits T>
Money operator+(T, const Money&) = delete;

[[nodiscard]] constexpr Money operator-(int64_t amount,
                                        const Money& money) noexcept {
  return -money + amount;
}
template <NonMinorUnits T>
Money operator-(T, const Money&) = delete;

template <Factor T>
[[nodiscard]] Money operator*(T factor, const Money& money) noexcept {
  return money * factor;
}

[[nodiscard]] constexpr Money abs(const Money& money) noexcept {
  return money.absolute_value();
}

std::ostream& operator<<(std::ostream& os, const Money& money);

}  // namespace money::core

namespace money {

using Money = core::Money;
using Value = core::Value;
using Quotient = core::Quotient;
using core::money_errc;

}  // namespace money

/// @brief 支持 fmt
template <>
struct fmt::formatter<money::core::Money> : fmt::formatter<std::string> {
  auto format(const money::core::Money& money, format_context& ctx) const {
    return fmt::formatter<std::string>::format(money.to_string(), ctx);
  }
};

// ======================
// std::hash 特化，與 operator== 一致只看金額
// ======================
template <>
struct std::hash<money::core::Money> {
  size_t operator()(const money::core::Money& money) const noexcept {
    return std::hash<int64_t>{}(money.amount());
  }
};

#endif
