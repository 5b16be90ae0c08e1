#include "money/core/error.hpp"

#include <string>
#include <system_error>

namespace money::core {

const std::error_category& money_category() noexcept {
  static const struct : public std::error_category {
    const char* name() const noexcept override { return "money.core"; }
    std::string message(int ev) const override {
      using enum money_errc;
      switch (static_cast<money_errc>(ev)) {
        case invalid_amount:
          return "Invalid amount (wrong input type)";
        case invalid_operand:
          return "Invalid operand for this operation";
        case division_by_zero:
          return "Division by zero";
        case amount_overflow:
          return "Amount out of range";
        case invalid_format:
          return "Invalid currency string";
        case unknown_currency:
          return "Unknown currency code";
        case unsupported_locale:
          return "Unsupported display locale";
      }
      return "Unknown money error";
    }
  } instance;

  return instance;
}

std::error_code make_error_code(money_errc ec) noexcept {
  return std::error_code(static_cast<int>(ec), money_category());
}

}  // namespace money::core
