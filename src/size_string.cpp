#include "size_string.hpp"
#include "errors.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <system_error>

using namespace std::literals;

namespace {

auto suffix_multiplier(const char c) noexcept -> std::uint64_t
{
   switch (c) {
   case 'k':
   case 'K':
      return 1024ull;
   case 'm':
   case 'M':
      return 1024ull * 1024ull;
   case 'g':
   case 'G':
      return 1024ull * 1024ull * 1024ull;
   default:
      return 0;
   }
}

auto parse_integer(std::string_view digits, std::string_view text) -> std::uint64_t
{
   if (!string_is_digits(digits)) {
      throw Parse_error{fmt::format("Invalid size '{}'."sv, text)};
   }

   std::uint64_t value = 0;

   const auto [last, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);

   if (ec == std::errc::result_out_of_range) {
      throw Parse_error{fmt::format("Size '{}' is too large."sv, text)};
   }

   if (ec != std::errc{} || last != digits.data() + digits.size()) {
      throw Parse_error{fmt::format("Invalid size '{}'."sv, text)};
   }

   return value;
}

// Accepts "12", "12.", "12.5" and ".5".
bool is_decimal_literal(std::string_view string) noexcept
{
   const auto point = string.find('.');

   if (point == string.npos) return string_is_digits(string);

   const auto whole = string.substr(0, point);
   const auto fraction = string.substr(point + 1);

   if (whole.empty() && fraction.empty()) return false;
   if (!whole.empty() && !string_is_digits(whole)) return false;
   if (!fraction.empty() && !string_is_digits(fraction)) return false;

   return true;
}

auto parse_scaled(std::string_view number, const std::uint64_t multiplier,
                  std::string_view text) -> std::uint64_t
{
   if (number.find('.') == number.npos) {
      const auto value = parse_integer(number, text);

      if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
         throw Parse_error{fmt::format("Size '{}' is too large."sv, text)};
      }

      return value * multiplier;
   }

   if (!is_decimal_literal(number)) {
      throw Parse_error{fmt::format("Invalid size '{}'."sv, text)};
   }

   const auto scaled = std::stod(std::string{number}) * static_cast<double>(multiplier);

   // 2^64 is exactly representable, anything at or above it does not fit.
   if (!std::isfinite(scaled) || scaled >= 18446744073709551616.0) {
      throw Parse_error{fmt::format("Size '{}' is too large."sv, text)};
   }

   return static_cast<std::uint64_t>(scaled);
}
}

auto parse_size(std::string_view size_string) -> std::uint64_t
{
   const auto trimmed = trim_whitespace(size_string);

   if (trimmed.empty()) throw Parse_error{"Size must not be empty."s};

   const auto multiplier = suffix_multiplier(trimmed.back());

   if (multiplier == 0) return parse_integer(trimmed, size_string);

   return parse_scaled(trimmed.substr(0, trimmed.size() - 1), multiplier, size_string);
}

auto parse_count(std::string_view count_string) -> std::uint64_t
{
   const auto trimmed = trim_whitespace(count_string);

   if (!string_is_digits(trimmed)) {
      throw Parse_error{fmt::format("Invalid count '{}'."sv, count_string)};
   }

   std::uint64_t value = 0;

   const auto [last, ec] =
      std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);

   if (ec != std::errc{} || last != trimmed.data() + trimmed.size()) {
      throw Parse_error{fmt::format("Invalid count '{}'."sv, count_string)};
   }

   return value;
}
