#include "money/format/currency.hpp"

#include <fmt/format.h>

#include <array>
#include <cassert>
#include <iterator>

#include "money/core/error.hpp"
#include "money/core/rounding.hpp"
#include "money/error.hpp"

namespace money::format {

namespace {

constexpr std::array CURRENCIES{USD, EUR, GBP, JPY};
constexpr std::array LOCALES{EN_US};

constexpr uint64_t scale_of(int digits) noexcept {
  uint64_t scale = 1;
  for (int i = 0; i < digits; ++i) {
    scale *= 10;
  }
  return scale;
}

}  // namespace

Result<CurrencyInfo> find_currency(std::string_view code) noexcept {
  for (const auto& currency : CURRENCIES) {
    if (currency.code == code) {
      return currency;
    }
  }
  return money::fail(core::money_errc::unknown_currency);
}

Result<LocaleInfo> find_locale(std::string_view name) noexcept {
  for (const auto& locale : LOCALES) {
    if (locale.name == name) {
      return locale;
    }
  }
  return money::fail(core::money_errc::unsupported_locale);
}

std::string format_currency(int64_t minor_units, const CurrencyInfo& currency,
                            const LocaleInfo& locale) {
  // 10^19 已超出 uint64，group_size 為 0 時無法分組
  assert(currency.digits >= 0 && currency.digits <= 18);
  assert(locale.group_size > 0);

  const uint64_t scale = scale_of(currency.digits);
  const uint64_t mag = core::magnitude(minor_units);

  std::string whole = fmt::format("{}", mag / scale);

  std::string out;
  out.reserve(whole.size() + whole.size() / 3 + currency.symbol.size() + 8);

  if (minor_units < 0) {
    out.push_back('-');
  }
  out.append(currency.symbol);

  // 千分位：第一組可能不足 group_size 位
  size_t group = static_cast<size_t>(locale.group_size);
  size_t lead = whole.size() % group;
  if (lead == 0) {
    lead = group;
  }
  out.append(whole, 0, lead);
  for (size_t pos = lead; pos < whole.size(); pos += group) {
    out.push_back(locale.group_separator);
    out.append(whole, pos, group);
  }

  if (currency.digits > 0) {
    fmt::format_to(std::back_inserter(out), "{}{:0{}}",
                   locale.decimal_separator, mag % scale, currency.digits);
  }

  return out;
}

Result<std::string> format_currency(int64_t minor_units, std::string_view code,
                                    std::string_view locale) {
  auto currency = TRY(find_currency(code));
  auto display = TRY(find_locale(locale));

  return format_currency(minor_units, currency, display);
}

}  // namespace money::format
