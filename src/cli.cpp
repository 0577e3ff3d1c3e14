#include "cli.hpp"
#include "fractal.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>

namespace {

bool is_flag(const char* arg, const char* short_name, const char* long_name)
{
    return (short_name && std::strcmp(arg, short_name) == 0)
        || std::strcmp(arg, long_name) == 0;
}

}  // namespace

std::string parse_args(int argc, const char* const* argv, ViewState& vs, bool& show_help)
{
    show_help = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Switches without a value
        if (is_flag(arg, "-h", "--help"))      { show_help   = true; continue; }
        if (is_flag(arg, "-i", "--invert"))    { vs.invert    = true; continue; }
        if (is_flag(arg, "-v", "--verbose"))   { vs.verbose   = true; continue; }
        if (is_flag(arg, nullptr, "--color"))  { vs.color     = true; continue; }
        if (is_flag(arg, nullptr, "--benchmark")) { vs.benchmark = true; continue; }

        if (i + 1 >= argc)
            return std::string("Missing value for ") + arg;
        const std::string val = argv[++i];

        if (is_flag(arg, "-z", "--zoom")) {
            if (!parse_number(val, vs.magnitude))
                return "error parsing zoom magnitude: " + val;
        } else if (is_flag(arg, "-c", "--center")) {
            if (!parse_complex(val, vs.center_x, vs.center_y))
                return "error parsing center point: " + val;
        } else if (is_flag(arg, "-d", "--dimensions")) {
            std::pair<long, long> dims;
            if (!parse_pair(val, 'x', dims)
                || dims.first  < 0 || dims.first  > std::numeric_limits<int>::max()
                || dims.second < 0 || dims.second > std::numeric_limits<int>::max())
                return "error parsing image dimensions: " + val;
            vs.width  = static_cast<int>(dims.first);
            vs.height = static_cast<int>(dims.second);
        } else if (is_flag(arg, "-l", "--limit")) {
            long n = 0;
            if (!parse_number(val, n) || n < 0)
                return "error parsing iteration limit: " + val;
            vs.max_iter = static_cast<std::size_t>(n);
        } else if (is_flag(arg, "-a", "--algorithm")) {
            bool known = true;
            vs.algorithm = parse_algorithm(val, &known);
            if (!known)
                std::fprintf(stderr, "warning: unknown algorithm '%s', using %s\n",
                             val.c_str(), algorithm_name(vs.algorithm));
        } else if (is_flag(arg, nullptr, "--escape-norm")) {
            if (!parse_number(val, vs.escape_norm))
                return "error parsing escape norm: " + val;
        } else if (is_flag(arg, "-o", "--output")) {
            if (val.empty())
                return "output file name is empty";
            vs.output = val;
        } else if (is_flag(arg, "-t", "--threads")) {
            long n = 0;
            if (!parse_number(val, n) || n < 0 || n > 4096)
                return "error parsing thread count: " + val;
            vs.threads = static_cast<int>(n);
        } else if (is_flag(arg, nullptr, "--bands")) {
            if (val == "row")         vs.band_mode = BandMode::PerRow;
            else if (val == "thread") vs.band_mode = BandMode::PerThread;
            else return "bands must be 'row' or 'thread': " + val;
        } else if (is_flag(arg, nullptr, "--dispatch")) {
            if (val == "queue")       vs.dispatch = Dispatch::Queued;
            else if (val == "cursor") vs.dispatch = Dispatch::Cursor;
            else return "dispatch must be 'queue' or 'cursor': " + val;
        } else if (is_flag(arg, nullptr, "--format")) {
            if (val == "png")         vs.format = OutputFormat::Png;
            else if (val == "jxl")    vs.format = OutputFormat::Jxl;
            else return "format must be 'png' or 'jxl': " + val;
        } else {
            return std::string("Unknown option: ") + arg;
        }
    }
    return {};
}

std::string validate_view(const ViewState& vs)
{
    if (vs.width <= 0 || vs.height <= 0)
        return "invalid dimensions: width and height must be positive";
    if (vs.max_iter == 0)
        return "invalid iteration limit: must be positive";
    if (!std::isfinite(vs.magnitude) || vs.magnitude <= 0.0)
        return "invalid zoom magnitude: must be a positive number";
    if (!std::isfinite(vs.escape_norm) || vs.escape_norm <= 0.0)
        return "invalid escape norm: must be a positive number";
    if (!std::isfinite(vs.center_x) || !std::isfinite(vs.center_y))
        return "invalid center point: components must be finite";
    return {};
}

void print_usage(const char* prog)
{
    std::printf(
        "Usage: %s [options]\n"
        "\n"
        "  -z, --zoom <f>           side length of the rendered square (default 4.0)\n"
        "  -c, --center <re,im>     center of the region (default 0,0)\n"
        "  -d, --dimensions <WxH>   image size in pixels (default 1920x1080)\n"
        "  -l, --limit <n>          iteration limit (default 255)\n"
        "  -a, --algorithm <name>   escape_time | burning_ship (default escape_time)\n"
        "      --escape-norm <f>    |z|^2 escape threshold for escape_time (default %g,\n"
        "                           %g reproduces the reference renders)\n"
        "  -i, --invert             invert the intensity ramp\n"
        "  -o, --output <file>      output file (default mandelbrot.png)\n"
        "  -t, --threads <n>        worker threads, 0 = all cores\n"
        "      --bands <mode>       row | thread (default row)\n"
        "      --dispatch <mode>    queue | cursor (default queue)\n"
        "      --format <fmt>       png | jxl (default png)\n"
        "      --color              RGB iteration-count image, written to color_<output>\n"
        "      --benchmark          time the renderer and exit\n"
        "  -v, --verbose            print the band plan\n"
        "  -h, --help               show this help\n",
        prog, CANONICAL_ESCAPE_NORM, REFERENCE_ESCAPE_NORM);
}
