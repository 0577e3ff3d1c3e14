#include "view_state.hpp"
#include "renderer.hpp"
#include "cpu_renderer.hpp"
#include "color_renderer.hpp"
#include "cli.hpp"
#include "cli_benchmark.hpp"
#include "export.hpp"

#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// Band plan dump for --verbose
// ---------------------------------------------------------------------------
static void print_bands(const BandRenderer& renderer)
{
    const auto& bands = renderer.last_bands();
    std::printf("%zu bands\n", bands.size());
    for (size_t i = 0; i < bands.size(); ++i) {
        const Band& b = bands[i];
        std::printf("  band %4zu  rows %5d..%5d  (%.9g, %.9g) - (%.9g, %.9g)\n",
                    i, b.first_row, b.first_row + b.rows - 1,
                    b.region.upper_left.real(),  b.region.upper_left.imag(),
                    b.region.lower_right.real(), b.region.lower_right.imag());
    }
}

static std::string write_image(const ViewState& vs, const std::string& path,
                               const PixelBuffer& buf)
{
    if (vs.format == OutputFormat::Jxl) {
#ifdef HAVE_JXL
        return export_jxl(path.c_str(), buf);
#else
        return "JPEG XL support was not compiled in";
#endif
    }
    return export_png(path.c_str(), buf);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    ViewState vs;
    bool      show_help = false;

    const std::string parse_err = parse_args(argc, argv, vs, show_help);
    if (!parse_err.empty()) {
        std::fprintf(stderr, "error: %s\n", parse_err.c_str());
        print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    const std::string invalid = validate_view(vs);
    if (!invalid.empty()) {
        std::fprintf(stderr, "error: %s\n", invalid.c_str());
        return 1;
    }

    if (vs.benchmark)
        return run_cli_benchmark(vs);

    std::unique_ptr<BandRenderer> renderer;
    std::string                   path = vs.output;
    if (vs.color) {
        renderer = std::make_unique<ColorRenderer>();
        path     = prefixed_filename(vs.output, "color_");
    } else {
        renderer = std::make_unique<CpuRenderer>();
    }

    PixelBuffer pbuf;
    renderer->render(vs, pbuf);

    std::printf("%dx%d  %s  limit %zu  %d threads  %zu bands (%s, %s)  %.1f ms\n",
                vs.width, vs.height,
                vs.color ? "color" : algorithm_name(vs.algorithm),
                vs.max_iter, renderer->thread_count, renderer->last_bands().size(),
                band_mode_name(vs.band_mode), dispatch_name(vs.dispatch),
                renderer->last_render_ms);
    if (vs.verbose)
        print_bands(*renderer);

    const std::string err = write_image(vs, path, pbuf);
    if (!err.empty()) {
        std::fprintf(stderr, "error writing %s: %s\n", path.c_str(), err.c_str());
        return 1;
    }
    std::printf("wrote %s\n", path.c_str());
    return 0;
}
