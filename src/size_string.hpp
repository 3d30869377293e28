#pragma once

#include <cstdint>
#include <string_view>

// Parses sizes like "100", "512K", "10m" or "1.5G". Suffixes are powers of 1024 and
// a fractional value is truncated after scaling. Throws Parse_error.
auto parse_size(std::string_view size_string) -> std::uint64_t;

// Parses a plain positive decimal count such as the --parts value. Throws Parse_error.
auto parse_count(std::string_view count_string) -> std::uint64_t;
