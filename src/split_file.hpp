#pragma once

#include "file_saver.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Parts_count {
   std::uint64_t count{};
};

struct Max_part_size {
   std::uint64_t bytes{};
};

using Split_strategy = std::variant<Parts_count, Max_part_size>;

struct Part_range {
   std::uint64_t index{};
   std::uint64_t offset{};
   std::uint64_t length{};
};

// Picks the strategy from the command line values. A part count takes precedence over a
// maximum part size. Throws Configuration_error if neither is usable.
auto make_split_strategy(std::optional<std::uint64_t> parts,
                         std::optional<std::uint64_t> max_size) -> Split_strategy;

// Turns the command line text into a strategy, in the order the checks are reported:
// both values are parsed (Parse_error), then the source must exist
// (File_not_found_error), then make_split_strategy applies. Nothing is written.
auto resolve_split_strategy(const std::filesystem::path& source,
                            const std::optional<std::string>& parts_text,
                            const std::optional<std::string>& max_size_text)
   -> Split_strategy;

// Throws File_not_found_error unless path names a regular file.
void check_source_file(const std::filesystem::path& path);

auto plan_parts(std::uint64_t file_size, const Split_strategy& strategy)
   -> std::vector<Part_range>;

// Writes "<path>.part1" ... next to path and returns the created part paths.
auto split_file(const std::filesystem::path& path, const Split_strategy& strategy,
                File_saver& file_saver) -> std::vector<std::filesystem::path>;
