#include "combine_parts.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "part_files.hpp"
#include "stream_copy.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

auto append_part(const Part_file& part, std::ostream& output, gsl::span<char> buffer)
   -> std::uint64_t
{
   std::ifstream input{part.path, std::ios::in | std::ios::binary};

   if (!input) {
      throw std::runtime_error{fmt::format("Unable to open part file '{}': {}"sv,
                                           part.path.string(), std::strerror(errno))};
   }

   return copy_stream(input, output, copy_until_eof, buffer);
}
}

auto parts_directory(const fs::path& path) -> fs::path
{
   const auto parent = path.parent_path();

   return parent.empty() ? fs::path{"."} : parent;
}

auto combine_parts(const fs::path& path, File_saver& file_saver) -> fs::path
{
   const auto base_name = path.filename().string();

   if (base_name.empty()) {
      throw Configuration_error{
         fmt::format("'{}' does not name a file to combine."sv, path.string())};
   }

   const auto parts = find_part_files(file_saver.directory(), base_name);

   if (parts.empty()) {
      throw No_parts_found_error{
         fmt::format("No parts found for '{}'."sv, path.string())};
   }

   auto output = file_saver.open_save_file(base_name);

   std::vector<char> buffer(copy_buffer_size);

   for (const auto& part : parts) {
      const auto added = append_part(part, output, buffer);

      console::print("Added: {} ({} bytes)", part.path.string(),
                     format_byte_count(added));
   }

   output.close();

   const auto output_path = file_saver.build_file_path(base_name);

   if (!output) {
      throw std::runtime_error{
         fmt::format("Failed writing combined file '{}'."sv, output_path.string())};
   }

   console::print("Combined into '{}'", output_path.string());

   return output_path;
}
