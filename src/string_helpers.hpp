#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool begins_with(
   std::basic_string_view<Char_t, Char_triats> string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   if (what.size() > string.size()) return false;

   return (string.substr(0, what.size()) == what);
}

template<typename Char_t, typename Char_triats = std::char_traits<Char_t>>
constexpr bool begins_with(
   const std::basic_string<Char_t, Char_triats>& string,
   typename std::common_type<std::basic_string_view<Char_t, Char_triats>>::type
      what) noexcept
{
   return begins_with(std::basic_string_view<Char_t, Char_triats>{string}, what);
}

constexpr bool is_ascii_digit(const char c) noexcept
{
   return (c >= '0' && c <= '9');
}

inline bool string_is_digits(std::string_view string) noexcept
{
   if (string.empty()) return false;

   return std::all_of(std::cbegin(string), std::cend(string), is_ascii_digit);
}

constexpr auto trim_whitespace(std::string_view string) noexcept -> std::string_view
{
   constexpr std::string_view whitespace{" \t\r\n\f\v"};

   const auto first = string.find_first_not_of(whitespace);

   if (first == string.npos) return {};

   const auto last = string.find_last_not_of(whitespace);

   return string.substr(first, last - first + 1);
}

// 1234567 -> "1,234,567"
inline auto format_byte_count(const std::uint64_t count) -> std::string
{
   const auto digits = std::to_string(count);

   std::string result;
   result.reserve(digits.size() + digits.size() / 3);

   for (std::size_t i = 0; i < digits.size(); ++i) {
      if (i != 0 && (digits.size() - i) % 3 == 0) result += ',';

      result += digits[i];
   }

   return result;
}
