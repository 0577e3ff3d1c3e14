#pragma once

#include "view_state.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

// Parse one number, rejecting empty input, trailing characters and overflow.
inline bool parse_number(const std::string& s, double& out)
{
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

inline bool parse_number(const std::string& s, long& out)
{
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

// "<left><separator><right>" with both halves parsed as T.
template<typename T>
bool parse_pair(const std::string& s, char separator, std::pair<T, T>& out)
{
    const std::string::size_type at = s.find(separator);
    if (at == std::string::npos) return false;
    T left{}, right{};
    if (!parse_number(s.substr(0, at), left) || !parse_number(s.substr(at + 1), right))
        return false;
    out = {left, right};
    return true;
}

inline bool parse_complex(const std::string& s, double& re, double& im)
{
    std::pair<double, double> p;
    if (!parse_pair(s, ',', p)) return false;
    re = p.first;
    im = p.second;
    return true;
}

// Fill vs from the command line. Returns empty string on success, or an
// error message. show_help is set when -h/--help was given.
std::string parse_args(int argc, const char* const* argv, ViewState& vs, bool& show_help);

// Reject settings the renderer cannot work with: zero or negative
// dimensions, a zero iteration limit, a non-positive or non-finite zoom.
std::string validate_view(const ViewState& vs);

void print_usage(const char* prog);
