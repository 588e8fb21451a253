#pragma once

#include "view_state.hpp"

#include <optional>
#include <string>
#include <utility>

struct CliOptions {
    std::string output_path;
    ViewState   view;
    int         threads       = 0;   // 0 = hardware concurrency
    int         rows_per_band = 8;
    int         palette       = 0;   // PALETTE_GRAY
    bool        verbose       = false;
    bool        benchmark     = false;
    bool        help          = false;
};

// Parses one number that must span the whole of `s`.
std::optional<int>    parse_number_int(const std::string& s);
std::optional<double> parse_number_double(const std::string& s);

template <typename T> std::optional<T> parse_number(const std::string& s);
template <> inline std::optional<int>    parse_number<int>(const std::string& s)
    { return parse_number_int(s); }
template <> inline std::optional<double> parse_number<double>(const std::string& s)
    { return parse_number_double(s); }

// Parses "<left><sep><right>", e.g. "400x600" or "1.0,0.5". Splits at the
// first separator; both halves must parse completely.
template <typename T>
std::optional<std::pair<T, T>> parse_pair(const std::string& s, char sep)
{
    const size_t at = s.find(sep);
    if (at == std::string::npos)
        return std::nullopt;
    const auto l = parse_number<T>(s.substr(0, at));
    const auto r = parse_number<T>(s.substr(at + 1));
    if (!l || !r)
        return std::nullopt;
    return std::make_pair(*l, *r);
}

// "RE,IM" with finite components.
std::optional<PlanePoint> parse_point(const std::string& s);

// Parses argv. On failure returns std::nullopt and sets `error`.
// A --help or --benchmark request returns options with only that flag set.
std::optional<CliOptions> parse_args(int argc, const char* const* argv,
                                     std::string& error);

void print_usage(const char* prog);
