#pragma once

#include <stdexcept>

class File_not_found_error : public std::runtime_error {
public:
   using std::runtime_error::runtime_error;
};

class Directory_read_error : public std::runtime_error {
public:
   using std::runtime_error::runtime_error;
};

class No_parts_found_error : public std::runtime_error {
public:
   using std::runtime_error::runtime_error;
};

// Bad or missing command line input. Raised before any file is touched.
class Configuration_error : public std::invalid_argument {
public:
   using std::invalid_argument::invalid_argument;
};

class Parse_error : public std::invalid_argument {
public:
   using std::invalid_argument::invalid_argument;
};
