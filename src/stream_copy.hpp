#pragma once

#include <gsl/gsl>

#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>

constexpr std::size_t copy_buffer_size = 1024 * 1024;

constexpr auto copy_until_eof = std::numeric_limits<std::uint64_t>::max();

// Copies up to max_bytes from input to output through buffer. Stops early at the end
// of input and returns the number of bytes copied. Throws std::runtime_error on a
// read or write failure.
auto copy_stream(std::istream& input, std::ostream& output, std::uint64_t max_bytes,
                 gsl::span<char> buffer) -> std::uint64_t;
