#include "split_file.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "part_files.hpp"
#include "size_string.hpp"
#include "stream_copy.hpp"
#include "string_helpers.hpp"

#include <gsl/gsl>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

constexpr auto divide_round_up(const std::uint64_t value,
                               const std::uint64_t divisor) noexcept -> std::uint64_t
{
   return (value == 0) ? 0 : ((value - 1) / divisor + 1);
}

struct Part_sizing {
   std::uint64_t part_count{};
   std::uint64_t part_size{};
};

auto compute_sizing(const std::uint64_t file_size, const Split_strategy& strategy)
   -> Part_sizing
{
   if (const auto* parts = std::get_if<Parts_count>(&strategy); parts) {
      Expects(parts->count >= 1);

      return {parts->count, divide_round_up(file_size, parts->count)};
   }

   const auto& max_size = std::get<Max_part_size>(strategy);

   Expects(max_size.bytes >= 1);

   // An empty file still gets one (empty) part so it can be combined again.
   return {std::max<std::uint64_t>(divide_round_up(file_size, max_size.bytes), 1),
           max_size.bytes};
}

template<typename Parser>
auto parse_optional(const std::optional<std::string>& text, Parser parser)
   -> std::optional<std::uint64_t>
{
   if (!text) return std::nullopt;

   return parser(*text);
}
}

void check_source_file(const fs::path& path)
{
   std::error_code ec;

   if (!fs::is_regular_file(path, ec)) {
      throw File_not_found_error{fmt::format("file '{}' not found."sv, path.string())};
   }
}

auto make_split_strategy(std::optional<std::uint64_t> parts,
                         std::optional<std::uint64_t> max_size) -> Split_strategy
{
   if (parts) {
      if (*parts == 0) throw Configuration_error{"--parts must be at least 1."s};

      return Parts_count{*parts};
   }

   if (max_size) {
      if (*max_size == 0) {
         throw Configuration_error{"--max-size must be at least 1 byte."s};
      }

      return Max_part_size{*max_size};
   }

   throw Configuration_error{"must specify either --max-size or --parts."s};
}

auto resolve_split_strategy(const fs::path& source,
                            const std::optional<std::string>& parts_text,
                            const std::optional<std::string>& max_size_text)
   -> Split_strategy
{
   const auto parts = parse_optional(parts_text, parse_count);
   const auto max_size = parse_optional(max_size_text, parse_size);

   check_source_file(source);

   return make_split_strategy(parts, max_size);
}

auto plan_parts(const std::uint64_t file_size, const Split_strategy& strategy)
   -> std::vector<Part_range>
{
   const auto sizing = compute_sizing(file_size, strategy);

   std::vector<Part_range> ranges;
   ranges.reserve(static_cast<std::size_t>(sizing.part_count));

   std::uint64_t offset = 0;

   for (std::uint64_t i = 0; i < sizing.part_count; ++i) {
      const auto length = std::min(sizing.part_size, file_size - offset);

      ranges.push_back({i + 1, offset, length});

      offset += length;
   }

   return ranges;
}

auto split_file(const fs::path& path, const Split_strategy& strategy,
                File_saver& file_saver) -> std::vector<fs::path>
{
   check_source_file(path);

   const auto file_size = fs::file_size(path);

   console::print("Splitting '{}' ({} bytes)", path.string(),
                  format_byte_count(file_size));

   std::ifstream source{path, std::ios::in | std::ios::binary};

   if (!source) {
      throw std::runtime_error{fmt::format("Unable to open file '{}': {}"sv,
                                           path.string(), std::strerror(errno))};
   }

   const auto base_name = path.filename();

   std::vector<char> buffer(copy_buffer_size);
   std::vector<fs::path> created;

   for (const auto& range : plan_parts(file_size, strategy)) {
      const auto part_name = build_part_path(base_name, range.index).string();

      auto part = file_saver.open_save_file(part_name);

      const auto written = copy_stream(source, part, range.length, buffer);

      part.close();

      if (!part) {
         throw std::runtime_error{
            fmt::format("Failed writing part file '{}'."sv, part_name)};
      }

      created.push_back(file_saver.build_file_path(part_name));

      console::print("Created: {} ({} bytes)", created.back().string(),
                     format_byte_count(written));
   }

   console::print("Split complete!");

   return created;
}
