#pragma once

#include "cpu_renderer.hpp"

// Alternate renderer: canonical Mandelbrot counts mapped to RGB with
// count_color(). Ignores the algorithm and invert settings.
class ColorRenderer : public BandRenderer {
protected:
    int channels() const override { return 3; }
    void render_band(const ViewState& vs, const ComplexRegion& region,
                     const Band& band, PixelBuffer& buf) const override;
};
