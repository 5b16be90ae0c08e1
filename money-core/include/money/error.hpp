#ifndef MONEY_ERROR_HPP
#define MONEY_ERROR_HPP

#include <expected>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>

namespace money {

/// @brief 最近一次失敗的診斷紀錄
struct ErrorContext {
  std::error_code ec;             ///< 失敗時的錯誤碼
  std::source_location location;  ///< 呼叫 fail() 的位置
  const char* message;            ///< 補充說明，必須是靜態字串
  bool is_active = false;
};

/// @brief 每個執行緒各自保存最後一次 fail() 的來源
/// @details Money 運算不寫 log，出錯時由呼叫端自行查詢此處
///
class ErrorRegistry {
 private:
  static inline thread_local ErrorContext last_info{};

 public:
  static void capture_origin(std::error_code ec, const char* msg,
                             std::source_location loc) noexcept;

  static const ErrorContext& get_last_error() noexcept { return last_info; }

  static void clear() noexcept { last_info.is_active = false; }
};

/// @brief 可失敗運算的回傳型別
/// @tparam T 成功值型別，預設 void
template <typename T = void>
using Result = std::expected<T, std::error_code>;

/// @brief 在錯誤源頭建立失敗結果，並登記到 ErrorRegistry
/// @param msg 靜態字串 (只存指標)
/// @param loc 預設為呼叫處
/// @warning 中途轉傳錯誤請用 TRY / CHECK，不要再呼叫 fail()
///
[[nodiscard]] inline auto fail(
    std::error_code ec, const char* msg = "",
    std::source_location loc = std::source_location::current()) noexcept {
  ErrorRegistry::capture_origin(ec, msg, loc);
  return std::unexpected(ec);
}

/// @brief 接受任何錯誤碼列舉 (money_errc、std::errc ...)
/// @details make_error_code 以 ADL 找到列舉所屬 namespace 的版本
template <typename E>
  requires std::is_error_code_enum_v<E> || std::is_error_condition_enum_v<E>
[[nodiscard]] auto fail(
    E code, const char* msg = "",
    std::source_location loc = std::source_location::current()) noexcept {
  using std::make_error_code;
  return fail(make_error_code(code), msg, loc);
}

/// @brief 將診斷紀錄轉為單行文字
/// @details 格式: "<category>: <message> (<context>) at <file>:<line> in <function>"
[[nodiscard]] std::string describe(const ErrorContext& context);

}  // namespace money

/// @brief 取出 Result 的值，失敗時直接 return 錯誤
/// @details GNU statement expression，只能用在回傳 Result 的函式內
///
/// @example
///   int64_t rhs = TRY(integer_operand(other, "..."));
///   auto usd = TRY(find_currency("USD"));
///
#define TRY(expr)                                                  \
  __extension__({                                                  \
    auto&& _res = (expr);                                          \
    static_assert(                                                 \
        requires {                                                 \
          _res.error();                                            \
          _res.has_value();                                        \
        }, "TRY() expects a Result / std::expected");              \
    if (!_res.has_value()) [[unlikely]] {                          \
      return std::unexpected(std::move(_res.error()));             \
    }                                                              \
    std::move(*_res);                                              \
  })

/// @brief 同 TRY，但丟棄成功值 (用於 Result<void>)
///
/// @example
///   CHECK(ensure_nonzero(divisor));
///
#define CHECK(expr)                                                \
  do {                                                             \
    auto&& _res = (expr);                                          \
    static_assert(                                                 \
        requires {                                                 \
          _res.error();                                            \
          _res.has_value();                                        \
        }, "CHECK() expects a Result / std::expected");            \
    if (!_res.has_value()) [[unlikely]] {                          \
      return std::unexpected(_res.error());                        \
    }                                                              \
  } while (0)

#endif
