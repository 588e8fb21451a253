#include "cli_args.hpp"
#include "palette.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

// strtol/strtod skip leading blanks; a number here must not have any.
static bool starts_clean(const std::string& s)
{
    return !s.empty() && !std::isspace(static_cast<unsigned char>(s[0]));
}

std::optional<int> parse_number_int(const std::string& s)
{
    if (!starts_clean(s)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v < INT_MIN || v > INT_MAX)
        return std::nullopt;
    return static_cast<int>(v);
}

std::optional<double> parse_number_double(const std::string& s)
{
    if (!starts_clean(s)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    // Underflow rounds to zero or a subnormal and is accepted; overflow is not.
    if (*end != '\0' || (errno == ERANGE && std::isinf(v)))
        return std::nullopt;
    return v;
}

std::optional<PlanePoint> parse_point(const std::string& s)
{
    const auto p = parse_pair<double>(s, ',');
    if (!p || !std::isfinite(p->first) || !std::isfinite(p->second))
        return std::nullopt;
    return PlanePoint{p->first, p->second};
}

// Value of "--name N" at argv[i + 1], as a positive int.
static std::optional<int> option_count(int argc, const char* const* argv, int& i,
                                       std::string& error)
{
    const std::string name = argv[i];
    if (i + 1 >= argc) {
        error = name + " needs a value";
        return std::nullopt;
    }
    const auto n = parse_number_int(argv[++i]);
    if (!n || *n < 1) {
        error = "invalid value for " + name + ": " + argv[i];
        return std::nullopt;
    }
    return n;
}

std::optional<CliOptions> parse_args(int argc, const char* const* argv,
                                     std::string& error)
{
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return opts;
        } else if (arg == "--benchmark") {
            opts.benchmark = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--threads") {
            const auto n = option_count(argc, argv, i, error);
            if (!n) return std::nullopt;
            opts.threads = *n;
        } else if (arg == "--rows-per-band") {
            const auto n = option_count(argc, argv, i, error);
            if (!n) return std::nullopt;
            opts.rows_per_band = *n;
        } else if (arg == "--palette") {
            if (i + 1 >= argc) {
                error = "--palette needs a value";
                return std::nullopt;
            }
            opts.palette = find_palette(argv[++i]);
            if (opts.palette < 0) {
                error = std::string("unknown palette: ") + argv[i];
                return std::nullopt;
            }
        } else if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
            error = "unknown option: " + arg;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (opts.benchmark) {
        if (!positional.empty()) {
            error = "--benchmark takes no positional arguments";
            return std::nullopt;
        }
        return opts;
    }

    if (positional.size() != 4) {
        error = "expected 4 arguments, got " + std::to_string(positional.size());
        return std::nullopt;
    }

    opts.output_path = positional[0];

    const auto bounds = parse_pair<int>(positional[1], 'x');
    if (!bounds || bounds->first < 1 || bounds->second < 1) {
        error = "error parsing image dimensions: " + positional[1];
        return std::nullopt;
    }
    const auto upper_left = parse_point(positional[2]);
    if (!upper_left) {
        error = "error parsing upper left corner point: " + positional[2];
        return std::nullopt;
    }
    const auto lower_right = parse_point(positional[3]);
    if (!lower_right) {
        error = "error parsing lower right corner point: " + positional[3];
        return std::nullopt;
    }

    opts.view.width       = bounds->first;
    opts.view.height      = bounds->second;
    opts.view.upper_left  = *upper_left;
    opts.view.lower_right = *lower_right;
    return opts;
}

void print_usage(const char* prog)
{
    std::fprintf(stderr,
        "Usage: %s FILE PIXELS UPPERLEFT LOWERRIGHT [options]\n"
        "       %s --benchmark\n"
        "Example: %s mandel.png 1000x750 -1.20,0.35 -1,0.20\n"
        "\n"
        "  FILE        output image (.png, or .jxl when built with libjxl)\n"
        "  PIXELS      WIDTHxHEIGHT\n"
        "  UPPERLEFT   RE,IM of the upper left corner\n"
        "  LOWERRIGHT  RE,IM of the lower right corner\n"
        "\n"
        "Options:\n"
        "  --threads N          worker threads (default: logical CPU count)\n"
        "  --rows-per-band N    rows per claimed range (default: 8)\n"
        "  --palette NAME       gray, smooth, fire, ice, classic (default: gray)\n"
        "  --verbose            print per-worker statistics and timings\n"
        "  --benchmark          measure throughput for 1..N threads\n",
        prog, prog, prog);
}
