#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Strips spaces, tabs and line breaks from both ends.
std::string trim(const std::string& s);

// Lenient numeric text as sent by loosely-typed JSON producers ("5", " 8 ",
// "1.0"). The whole trimmed string must be consumed, otherwise nullopt.
std::optional<int64_t> parse_int_string(const std::string& s);
std::optional<double> parse_float_string(const std::string& s);
