#include "app_options.hpp"
#include "combine_parts.hpp"
#include "console.hpp"
#include "file_saver.hpp"
#include "split_file.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

void split_input_file(const App_options& options)
{
   const fs::path path{options.input_file()};

   const auto strategy =
      resolve_split_strategy(path, options.parts(), options.max_size());

   File_saver file_saver{path.parent_path(), options.verbose()};

   split_file(path, strategy, file_saver);
}

void combine_input_file(const App_options& options)
{
   const fs::path path{options.input_file()};

   File_saver file_saver{parts_directory(path), options.verbose()};

   combine_parts(path, file_saver);
}

auto get_file_processor(const Tool_mode mode) -> std::function<void(const App_options&)>
{
   if (mode == Tool_mode::split) return split_input_file;
   if (mode == Tool_mode::combine) return combine_input_file;

   throw std::invalid_argument{"Invalid tool mode."s};
}
}

int main(int argc, char* argv[])
{
   std::ios_base::sync_with_stdio(false);

   if (argc == 1) {
      App_options::print_usage(std::cout);

      return EXIT_FAILURE;
   }

   try {
      const App_options app_options{argc, argv};

      if (app_options.help_requested()) {
         App_options::print_usage(std::cout);

         return EXIT_SUCCESS;
      }

      const auto processor = get_file_processor(app_options.tool_mode());

      processor(app_options);
   }
   catch (std::exception& e) {
      console::error("{}", e.what());

      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}
