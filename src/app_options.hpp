#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Tool_mode { split, combine };

class App_options {
public:
   App_options(const App_options&) = delete;
   App_options& operator=(const App_options&) = delete;
   App_options(App_options&&) = delete;
   App_options& operator=(App_options&&) = delete;

   // Throws Configuration_error for a malformed command line. Option values are kept
   // as text; --parts and --max-size only mean something when splitting.
   App_options(const int argc, const char* const argv[]);

   auto input_file() const noexcept -> const std::string&;

   Tool_mode tool_mode() const noexcept;

   auto parts() const noexcept -> const std::optional<std::string>&;

   auto max_size() const noexcept -> const std::optional<std::string>&;

   bool verbose() const noexcept;

   bool help_requested() const noexcept;

   void print_arguments(std::ostream& ostream) const;

   static void print_usage(std::ostream& ostream);

private:
   App_options();

   using Option_handler = std::function<void(std::istream&)>;

   struct Option {
      std::string name;
      Option_handler handler;
      std::string_view description;
   };

   auto find_option_handler(std::string_view name) noexcept -> Option_handler*;

   void set_input_file(std::string file);

   std::vector<Option> _options;

   std::string _input_file;
   Tool_mode _tool_mode = Tool_mode::split;
   std::optional<std::string> _parts;
   std::optional<std::string> _max_size;
   bool _verbose = false;
   bool _help = false;
};
