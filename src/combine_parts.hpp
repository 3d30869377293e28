#pragma once

#include "file_saver.hpp"

#include <filesystem>

// Directory the parts of path live in; "." when path has no directory component.
auto parts_directory(const std::filesystem::path& path) -> std::filesystem::path;

// Concatenates the "<name>.part<N>" files found in the saver's directory, in ascending N,
// into a file named after the file name of path. Parts are left in place.
// Returns the output path.
auto combine_parts(const std::filesystem::path& path, File_saver& file_saver)
   -> std::filesystem::path;
