#pragma once

#include <complex>
#include <cstddef>

using Complex = std::complex<double>;

struct Dimensions {
    int width  = 0;
    int height = 0;

    std::size_t total_pixels() const
    {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
};

struct Pixel {
    int x = 0;
    int y = 0;
};

// Rectangle of the complex plane: upper_left.im >= lower_right.im and
// upper_left.re <= lower_right.re.
struct ComplexRegion {
    Complex upper_left;
    Complex lower_right;
};

// Map a pixel onto the region. Row 0 is the top edge (largest imaginary
// part). Coordinates are not clamped: (width, height) yields lower_right.
// bounds must be non-zero in both directions.
inline Complex pixel_to_point(Dimensions bounds, Pixel pixel, const ComplexRegion& region)
{
    const double plane_w = region.lower_right.real() - region.upper_left.real();
    const double plane_h = region.upper_left.imag() - region.lower_right.imag();

    return Complex(
        region.upper_left.real() + pixel.x * plane_w / bounds.width,
        region.upper_left.imag() - pixel.y * plane_h / bounds.height);
}

// Square region of side `magnitude` centered on (center_x, center_y).
// A non-positive magnitude gives a degenerate or inverted region.
inline ComplexRegion calculate_region(double magnitude, double center_x, double center_y)
{
    const double half = magnitude / 2.0;
    return ComplexRegion{
        Complex(center_x - half, center_y + half),
        Complex(center_x + half, center_y - half),
    };
}
