#pragma once

#include <fmt/format.h>

#include <iostream>
#include <utility>

// Status lines. Everything, errors included, goes to standard output.
namespace console {

template<typename... Args>
inline void print(fmt::format_string<Args...> format, Args&&... args)
{
   std::cout << fmt::format(format, std::forward<Args>(args)...) << '\n';
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
   std::cout << "Info: " << fmt::format(format, std::forward<Args>(args)...) << '\n';
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
   std::cout << "Error: " << fmt::format(format, std::forward<Args>(args)...) << '\n';
}
}
