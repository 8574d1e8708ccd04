#pragma once

#include <string>
#include <string_view>

// Argument value parsing shared by the inkcomp CLI.
namespace inkcomp::cli
{
// Base-10 integer that must fill the whole string and fit in an int.
// `out` is left untouched on failure.
bool ParseInt(std::string_view s, int& out);

// "key=value" with a non-empty key. The value may be empty or contain '='.
bool ParseBinding(std::string_view s, std::string& key, std::string& value);
} // namespace inkcomp::cli
