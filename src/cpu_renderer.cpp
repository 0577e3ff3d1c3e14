#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

#include <atomic>
#include <chrono>
#include <thread>

// -----------------------------------------------------------------------
// Constructor — build thread pool sized to the machine
// -----------------------------------------------------------------------
BandRenderer::BandRenderer()
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void BandRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    if (n == thread_count && pool) return;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Static division: every band becomes its own pool task
// -----------------------------------------------------------------------
void BandRenderer::dispatch_queued(const ViewState& vs, const ComplexRegion& region,
                                   PixelBuffer& buf)
{
    for (const Band& band : bands) {
        pool->submit([this, &vs, &region, &band, &buf] {
            render_band(vs, region, band, buf);
        });
    }
    pool->wait();
}

// -----------------------------------------------------------------------
// Dynamic pull: each worker claims the next unclaimed band until none remain
// -----------------------------------------------------------------------
void BandRenderer::dispatch_cursor(const ViewState& vs, const ComplexRegion& region,
                                   PixelBuffer& buf)
{
    std::atomic<size_t> cursor{0};
    pool->submit_per_worker([this, &vs, &region, &buf, &cursor] {
        for (;;) {
            const size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= bands.size()) return;
            render_band(vs, region, bands[i], buf);
        }
    });
    pool->wait();
}

// -----------------------------------------------------------------------
// Top-level render — plans bands and hands them to the pool
// -----------------------------------------------------------------------
void BandRenderer::render(const ViewState& vs, PixelBuffer& buf)
{
    render_region(vs, calculate_region(vs.magnitude, vs.center_x, vs.center_y), buf);
}

void BandRenderer::render_region(const ViewState& vs, const ComplexRegion& region,
                                 PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    bands.clear();
    if (vs.width <= 0 || vs.height <= 0) return;

    set_thread_count(vs.threads);

    buf.resize(vs.width, vs.height, channels());

    const Dimensions dims{vs.width, vs.height};
    bands = plan_bands(dims, region, rows_per_band(vs.band_mode, vs.height, thread_count));

    if (vs.dispatch == Dispatch::Cursor)
        dispatch_cursor(vs, region, buf);
    else
        dispatch_queued(vs, region, buf);

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}

// -----------------------------------------------------------------------
// Greyscale band fill. Pixels are mapped against the full image with their
// absolute row so the result does not depend on how rows were grouped.
// -----------------------------------------------------------------------
template<bool IsBurningShip>
static void fill_grey_band(const ViewState& vs, const ComplexRegion& region,
                           const Band& band, PixelBuffer& buf)
{
    const Dimensions  dims{buf.width, buf.height};
    const double      norm  = IsBurningShip ? CANONICAL_ESCAPE_NORM : vs.escape_norm;
    const std::size_t limit = vs.max_iter;

    for (int py = band.first_row; py < band.first_row + band.rows; ++py) {
        uint8_t* row = buf.row(py);
        for (int px = 0; px < dims.width; ++px) {
            const Complex c = pixel_to_point(dims, {px, py}, region);
            const EscapeResult r =
                escape_kernel<IsBurningShip>(c.real(), c.imag(), limit, norm);
            row[px] = map_intensity(r, limit, vs.invert);
        }
    }
}

void CpuRenderer::render_band(const ViewState& vs, const ComplexRegion& region,
                              const Band& band, PixelBuffer& buf) const
{
    switch (vs.algorithm) {
        case AlgorithmType::BurningShip:
            fill_grey_band<true>(vs, region, band, buf);
            break;
        case AlgorithmType::Classic:
        default:
            fill_grey_band<false>(vs, region, band, buf);
            break;
    }
}
