#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

struct Part_file {
   std::uint64_t index{};
   std::filesystem::path path;
};

// "dir/file.bin", 3 -> "dir/file.bin.part3"
auto build_part_path(const std::filesystem::path& path, const std::uint64_t index)
   -> std::filesystem::path;

// Returns the index if file_name is exactly "<base_name>.part<digits>".
auto match_part_index(std::string_view base_name, std::string_view file_name) noexcept
   -> std::optional<std::uint64_t>;

// Lists the parts of base_name found in directory, sorted by index.
// Throws Directory_read_error if the directory cannot be listed.
auto find_part_files(const std::filesystem::path& directory, std::string_view base_name)
   -> std::vector<Part_file>;
