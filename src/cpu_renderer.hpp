#pragma once

#include "renderer.hpp"
#include "view_state.hpp"
#include "band.hpp"
#include "thread_pool.hpp"

#include <memory>
#include <vector>

// Splits the image into horizontal bands and renders them on a thread pool.
// Subclasses fill in one band; the pixel layout and the band split are shared.
class BandRenderer : public IFractalRenderer {
public:
    BandRenderer();
    ~BandRenderer() override = default;

    // Renders the square region given by the view's zoom and center.
    void render(const ViewState& state, PixelBuffer& buf) override;

    // Same, over an explicit region; width/height still come from state.
    void render_region(const ViewState& state, const ComplexRegion& region, PixelBuffer& buf);

    double last_render_ms = 0.0;
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Band split used by the most recent render().
    const std::vector<Band>& last_bands() const { return bands; }

protected:
    virtual int channels() const = 0;
    virtual void render_band(const ViewState& vs, const ComplexRegion& region,
                             const Band& band, PixelBuffer& buf) const = 0;

private:
    void dispatch_queued(const ViewState& vs, const ComplexRegion& region, PixelBuffer& buf);
    void dispatch_cursor(const ViewState& vs, const ComplexRegion& region, PixelBuffer& buf);

    std::unique_ptr<ThreadPool> pool;
    std::vector<Band>           bands;
};

// Greyscale escape-time renderer: one byte per pixel.
class CpuRenderer : public BandRenderer {
protected:
    int channels() const override { return 1; }
    void render_band(const ViewState& vs, const ComplexRegion& region,
                     const Band& band, PixelBuffer& buf) const override;
};
