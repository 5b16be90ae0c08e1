#include "money/error.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string>

namespace money {

void ErrorRegistry::capture_origin(std::error_code ec, const char* msg,
                                   std::source_location loc) noexcept {
  last_info = {.ec = ec, .location = loc, .message = msg, .is_active = true};
}

std::string describe(const ErrorContext& context) {
  if (!context.is_active) {
    return "no error";
  }

  std::string text = fmt::format("{}: {}", context.ec.category().name(),
                                 context.ec.message());
  if (context.message != nullptr && context.message[0] != '\0') {
    fmt::format_to(std::back_inserter(text), " ({})", context.message);
  }
  fmt::format_to(std::back_inserter(text), " at {}:{} in {}",
                 context.location.file_name(), context.location.line(),
                 context.location.function_name());
  return text;
}

}  // namespace money
