#include "app_options.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <vector>

namespace {

class Arguments {
public:
   Arguments(std::initializer_list<const char*> args) : _args{"splitcat"}
   {
      _args.insert(_args.end(), args);
   }

   int argc() const noexcept
   {
      return static_cast<int>(_args.size());
   }

   auto argv() const noexcept -> const char* const*
   {
      return _args.data();
   }

private:
   std::vector<const char*> _args;
};
}

TEST(App_options, split_with_parts)
{
   const Arguments args{"file.bin", "--parts", "4"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.input_file(), "file.bin");
   EXPECT_EQ(options.tool_mode(), Tool_mode::split);
   EXPECT_EQ(options.parts(), "4");
   EXPECT_FALSE(options.max_size());
   EXPECT_FALSE(options.verbose());
}

TEST(App_options, options_may_precede_file)
{
   const Arguments args{"--max-size", "10M", "--verbose", "dir/file.bin"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.input_file(), "dir/file.bin");
   EXPECT_EQ(options.max_size(), "10M");
   EXPECT_TRUE(options.verbose());
}

TEST(App_options, combine_mode)
{
   const Arguments args{"file.bin", "--combine"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.tool_mode(), Tool_mode::combine);
}

TEST(App_options, file_names_with_spaces_survive)
{
   const Arguments args{"my file.bin", "--parts", "2"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.input_file(), "my file.bin");
}

TEST(App_options, both_strategies_are_kept)
{
   const Arguments args{"file.bin", "--parts", "3", "--max-size", "512K"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.parts(), "3");
   EXPECT_EQ(options.max_size(), "512K");
}

TEST(App_options, help)
{
   const Arguments args{"-h"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_TRUE(options.help_requested());

   std::ostringstream out;
   App_options::print_usage(out);

   EXPECT_NE(out.str().find("--max-size"), std::string::npos);
   EXPECT_NE(out.str().find("--combine"), std::string::npos);
}

TEST(App_options, missing_file_is_a_configuration_error)
{
   const Arguments args{"--parts", "2"};

   EXPECT_THROW((App_options{args.argc(), args.argv()}), Configuration_error);
}

TEST(App_options, unknown_option_is_a_configuration_error)
{
   const Arguments args{"file.bin", "--bogus"};

   EXPECT_THROW((App_options{args.argc(), args.argv()}), Configuration_error);
}

TEST(App_options, missing_value_is_a_configuration_error)
{
   const Arguments args{"file.bin", "--parts"};

   EXPECT_THROW((App_options{args.argc(), args.argv()}), Configuration_error);
}

TEST(App_options, extra_positional_is_a_configuration_error)
{
   const Arguments args{"a.bin", "b.bin"};

   EXPECT_THROW((App_options{args.argc(), args.argv()}), Configuration_error);
}

TEST(App_options, combine_ignores_split_values)
{
   const Arguments args{"file.bin", "--combine", "--max-size", "bogus", "--parts", "-2"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.tool_mode(), Tool_mode::combine);
   EXPECT_EQ(options.input_file(), "file.bin");
}

TEST(App_options, split_values_are_kept_as_text)
{
   const Arguments args{"file.bin", "--max-size", "lots", "--parts", "-2"};
   const App_options options{args.argc(), args.argv()};

   EXPECT_EQ(options.max_size(), "lots");
   EXPECT_EQ(options.parts(), "-2");
}
