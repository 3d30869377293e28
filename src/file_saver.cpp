#include "file_saver.hpp"
#include "console.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

File_saver::File_saver(const fs::path& directory, bool verbose) noexcept
   : _directory{directory}, _verbose{verbose}
{
}

auto File_saver::open_save_file(std::string_view name, std::ios_base::openmode openmode)
   -> std::ofstream
{
   const auto path = build_file_path(name);

   if (_verbose) console::info("Saving file {}", path.string());

   std::ofstream file{path, openmode | std::ios::out | std::ios::trunc};

   if (!file) {
      throw std::runtime_error{fmt::format("Unable to create file '{}': {}"sv,
                                           path.string(), std::strerror(errno))};
   }

   return file;
}

auto File_saver::build_file_path(std::string_view name) const -> fs::path
{
   return _directory / name;
}

auto File_saver::directory() const noexcept -> const fs::path&
{
   return _directory;
}

bool File_saver::verbose() const noexcept
{
   return _verbose;
}
