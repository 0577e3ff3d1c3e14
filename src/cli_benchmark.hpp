#pragma once

#include "cpu_renderer.hpp"
#include "view_state.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

// Times the greyscale renderer across algorithms, band modes and dispatch
// disciplines. Thread count comes from base.threads (0 = all cores).
inline int run_cli_benchmark(const ViewState& base)
{
    CpuRenderer renderer;
    renderer.set_thread_count(base.threads);

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    PixelBuffer buf;

    struct TestCase {
        const char*   label;
        AlgorithmType algorithm;
        BandMode      bands;
        Dispatch      dispatch;
    };

    const TestCase tests[] = {
        {"Mandelbrot",   AlgorithmType::Classic,     BandMode::PerRow,    Dispatch::Queued},
        {"Mandelbrot",   AlgorithmType::Classic,     BandMode::PerRow,    Dispatch::Cursor},
        {"Mandelbrot",   AlgorithmType::Classic,     BandMode::PerThread, Dispatch::Queued},
        {"Mandelbrot",   AlgorithmType::Classic,     BandMode::PerThread, Dispatch::Cursor},
        {"Burning Ship", AlgorithmType::BurningShip, BandMode::PerRow,    Dispatch::Queued},
        {"Burning Ship", AlgorithmType::BurningShip, BandMode::PerRow,    Dispatch::Cursor},
        {"Burning Ship", AlgorithmType::BurningShip, BandMode::PerThread, Dispatch::Queued},
        {"Burning Ship", AlgorithmType::BurningShip, BandMode::PerThread, Dispatch::Cursor},
    };

    std::printf("Fractal Render CLI Benchmark\n");
    std::printf("%dx%d, %zu iter, %d threads, %d runs (avg best %d)\n",
                W, H, base.max_iter, renderer.thread_count, RUNS, BEST_N);
    std::printf("%-16s %-8s %-10s %s\n", "Label", "Bands", "Dispatch", "Mpix/s");
    std::printf("------------------------------------------------\n");

    for (const auto& t : tests) {
        ViewState vs  = base;
        vs.width      = W;
        vs.height     = H;
        vs.algorithm  = t.algorithm;
        vs.band_mode  = t.bands;
        vs.dispatch   = t.dispatch;
        vs.threads    = renderer.thread_count;

        // Warm-up
        renderer.render(vs, buf);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            renderer.render(vs, buf);
            times[r] = renderer.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = avg_ms > 0.0 ? (W * H) / (avg_ms * 1000.0) : 0.0;

        std::printf("%-16s %-8s %-10s %6.2f\n", t.label,
                    band_mode_name(t.bands), dispatch_name(t.dispatch), mpixs);
    }
    return 0;
}
