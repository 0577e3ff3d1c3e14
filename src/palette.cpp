#include "palette.hpp"

#include <cmath>

// ---------------------------------------------------------------------------
// Count → RGB. Grey ramp; with a 255 budget the count is used as-is.
// ---------------------------------------------------------------------------
Rgb count_color(std::size_t count, std::size_t max_iter)
{
    if (count > max_iter)
        return {255, 255, 255};

    if (max_iter == 255) {
        const uint8_t v = static_cast<uint8_t>(count);
        return {v, v, v};
    }

    const double t = static_cast<double>(count) / static_cast<double>(max_iter);
    const uint8_t v = static_cast<uint8_t>(std::lround(t * 255.0));
    return {v, v, v};
}
