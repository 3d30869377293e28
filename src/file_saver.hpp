#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>

// Creates output files inside one directory. Existing files are truncated.
class File_saver {
public:
   File_saver(const std::filesystem::path& directory, bool verbose = false) noexcept;

   auto open_save_file(std::string_view name,
                       std::ios_base::openmode openmode = std::ios::binary)
      -> std::ofstream;

   auto build_file_path(std::string_view name) const -> std::filesystem::path;

   auto directory() const noexcept -> const std::filesystem::path&;

   bool verbose() const noexcept;

private:
   const std::filesystem::path _directory;
   const bool _verbose = false;
};
