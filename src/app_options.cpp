#include "app_options.hpp"
#include "errors.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

using namespace std::literals;

namespace {

std::stringstream create_arg_stream(int argc, const char* const argv[])
{
   std::stringstream arg_stream;

   for (auto i = 1; i < argc; ++i) {
      arg_stream << std::quoted(argv[i]) << ' ';
   }

   return arg_stream;
}

std::string read_option_value(std::istream& istream, std::string_view option)
{
   std::string str;

   if (!(istream >> std::quoted(str))) {
      throw Configuration_error{fmt::format("Option {} expects a value."sv, option)};
   }

   return str;
}

bool looks_like_option(std::string_view arg) noexcept
{
   return begins_with(arg, "-"sv) && arg.size() > 1;
}
}

constexpr auto usage{R"(Usage: splitcat <file> [options]

Splits <file> into <file>.part1, <file>.part2, ... or combines them again.

Options:)"sv};

constexpr auto max_size_opt_description{
   R"(<size> Max part size, e.g. '10M', '512K', '2G' or a byte count.
   Suffixes are powers of 1024 and may follow a fraction such as '1.5M'.)"sv};

constexpr auto parts_opt_description{
   R"(<count> Number of parts to split into. Takes precedence over --max-size.)"sv};

constexpr auto combine_opt_description{
   R"(Combine '<file>.part<N>' files back into <file> instead of splitting.)"sv};

constexpr auto verbose_opt_description{R"(Enable verbose output.)"sv};

constexpr auto help_opt_description{R"(Print this help.)"sv};

App_options::App_options()
{
   using Istr = std::istream;

   _options = {
      {"--max-size"s,
       [this](Istr& istr) { _max_size = read_option_value(istr, "--max-size"sv); },
       max_size_opt_description},
      {"--parts"s,
       [this](Istr& istr) { _parts = read_option_value(istr, "--parts"sv); },
       parts_opt_description},
      {"--combine"s, [this](Istr&) { _tool_mode = Tool_mode::combine; },
       combine_opt_description},
      {"--verbose"s, [this](Istr&) { _verbose = true; }, verbose_opt_description},
      {"--help"s, [this](Istr&) { _help = true; }, help_opt_description}};
}

App_options::App_options(const int argc, const char* const argv[]) : App_options()
{
   auto arg_stream = create_arg_stream(argc, argv);

   std::string arg;

   while (arg_stream >> std::quoted(arg)) {
      if (arg == "-h"sv) arg = "--help"s;

      if (!looks_like_option(arg)) {
         set_input_file(std::move(arg));

         continue;
      }

      const auto handler = find_option_handler(arg);

      if (!handler) {
         throw Configuration_error{fmt::format("Unknown option '{}'."sv, arg)};
      }

      (*handler)(arg_stream);
   }

   if (_input_file.empty() && !_help) {
      throw Configuration_error{"No input file specified."s};
   }
}

auto App_options::input_file() const noexcept -> const std::string&
{
   return _input_file;
}

Tool_mode App_options::tool_mode() const noexcept
{
   return _tool_mode;
}

auto App_options::parts() const noexcept -> const std::optional<std::string>&
{
   return _parts;
}

auto App_options::max_size() const noexcept -> const std::optional<std::string>&
{
   return _max_size;
}

bool App_options::verbose() const noexcept
{
   return _verbose;
}

bool App_options::help_requested() const noexcept
{
   return _help;
}

void App_options::print_arguments(std::ostream& ostream) const
{
   ostream << '\n';

   for (const auto& option : _options) {
      ostream << ' ' << option.name << ' ';
      ostream.write(option.description.data(), option.description.length());
      ostream << '\n';
   }

   ostream << '\n';
}

void App_options::print_usage(std::ostream& ostream)
{
   ostream << usage;

   App_options{}.print_arguments(ostream);
}

auto App_options::find_option_handler(std::string_view name) noexcept
   -> App_options::Option_handler*
{
   const auto result =
      std::find_if(std::begin(_options), std::end(_options),
                   [name](const Option& option) { return (option.name == name); });

   if (result == std::end(_options)) return nullptr;

   return &result->handler;
}

void App_options::set_input_file(std::string file)
{
   if (!_input_file.empty()) {
      throw Configuration_error{fmt::format("Unexpected extra argument '{}'."sv, file)};
   }

   _input_file = std::move(file);
}
