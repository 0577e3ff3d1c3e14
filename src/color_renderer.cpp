#include "color_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

void ColorRenderer::render_band(const ViewState& vs, const ComplexRegion& region,
                                const Band& band, PixelBuffer& buf) const
{
    const Dimensions  dims{buf.width, buf.height};
    const std::size_t max_iter = vs.max_iter;

    for (int py = band.first_row; py < band.first_row + band.rows; ++py) {
        uint8_t* row = buf.row(py);
        for (int px = 0; px < dims.width; ++px) {
            const Complex      c = pixel_to_point(dims, {px, py}, region);
            const EscapeResult r = escape_time(c, max_iter, CANONICAL_ESCAPE_NORM);
            const std::size_t count = r ? *r : count_sentinel(max_iter);

            const Rgb rgb = count_color(count, max_iter);
            row[px * 3 + 0] = rgb.r;
            row[px * 3 + 1] = rgb.g;
            row[px * 3 + 2] = rgb.b;
        }
    }
}
