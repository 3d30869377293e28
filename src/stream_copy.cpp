#include "stream_copy.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std::literals;

auto copy_stream(std::istream& input, std::ostream& output, std::uint64_t max_bytes,
                 gsl::span<char> buffer) -> std::uint64_t
{
   Expects(!buffer.empty());

   std::uint64_t copied = 0;

   while (copied < max_bytes && input) {
      const auto wanted = static_cast<std::size_t>(
         std::min<std::uint64_t>(max_bytes - copied, buffer.size()));

      input.read(buffer.data(), gsl::narrow<std::streamsize>(wanted));

      if (input.bad()) throw std::runtime_error{"Failed reading from input file."s};

      const auto got = input.gcount();

      if (got == 0) break;

      output.write(buffer.data(), got);

      if (!output) throw std::runtime_error{"Failed writing to output file."s};

      copied += static_cast<std::uint64_t>(got);
   }

   return copied;
}
