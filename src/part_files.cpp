#include "part_files.hpp"
#include "errors.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

constexpr auto part_marker = ".part"sv;

auto read_dir_entries(const fs::path& directory) -> std::vector<fs::path>
{
   std::vector<fs::path> entries;
   std::error_code ec;

   fs::directory_iterator iter{directory, ec};

   for (; !ec && iter != fs::directory_iterator{}; iter.increment(ec)) {
      entries.emplace_back(iter->path());
   }

   if (ec) {
      throw Directory_read_error{fmt::format("Error reading directory '{}': {}"sv,
                                             directory.string(), ec.message())};
   }

   return entries;
}

void sort_part_files(std::vector<Part_file>& parts)
{
   std::sort(std::begin(parts), std::end(parts),
             [](const Part_file& left, const Part_file& right) {
                return (left.index < right.index);
             });
}
}

auto build_part_path(const fs::path& path, const std::uint64_t index) -> fs::path
{
   auto part_path = path;
   part_path += fmt::format("{}{}"sv, part_marker, index);

   return part_path;
}

auto match_part_index(std::string_view base_name, std::string_view file_name) noexcept
   -> std::optional<std::uint64_t>
{
   if (!begins_with(file_name, base_name)) return std::nullopt;

   file_name.remove_prefix(base_name.size());

   if (!begins_with(file_name, part_marker)) return std::nullopt;

   file_name.remove_prefix(part_marker.size());

   if (!string_is_digits(file_name)) return std::nullopt;

   std::uint64_t index = 0;

   const auto [last, ec] =
      std::from_chars(file_name.data(), file_name.data() + file_name.size(), index);

   if (ec != std::errc{} || last != file_name.data() + file_name.size()) {
      return std::nullopt;
   }

   return index;
}

auto find_part_files(const fs::path& directory, std::string_view base_name)
   -> std::vector<Part_file>
{
   std::vector<Part_file> parts;

   for (const auto& path : read_dir_entries(directory)) {
      const auto file_name = path.filename().string();

      if (const auto index = match_part_index(base_name, file_name); index) {
         parts.push_back({*index, path});
      }
   }

   sort_part_files(parts);

   return parts;
}
