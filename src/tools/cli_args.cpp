#include "tools/cli_args.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace inkcomp::cli
{
bool ParseInt(std::string_view s, int& out)
{
    if (s.empty())
        return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno == ERANGE || !end || end == tmp.c_str() || *end != '\0')
        return false;
    if (v < INT_MIN || v > INT_MAX)
        return false;
    out = (int)v;
    return true;
}

bool ParseBinding(std::string_view s, std::string& key, std::string& value)
{
    const size_t eq = s.find('=');
    if (eq == std::string_view::npos || eq == 0)
        return false;
    key.assign(s.substr(0, eq));
    value.assign(s.substr(eq + 1));
    return true;
}
} // namespace inkcomp::cli
