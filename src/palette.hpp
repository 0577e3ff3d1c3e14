#pragma once

#include <cstddef>
#include <cstdint>

#include "fractal.hpp"

// Linear map of value from [from_lo, from_hi] to [to_lo, to_hi], truncating.
// from_hi must be greater than from_lo.
inline std::size_t map_ranges(std::size_t value,
                              std::size_t from_lo, std::size_t from_hi,
                              std::size_t to_lo,   std::size_t to_hi)
{
    const std::size_t range     = from_hi - from_lo;
    const std::size_t new_range = to_hi - to_lo;
    return to_lo + (value - from_lo) * new_range / range;
}

// Greyscale byte for an escape result. Points that never escaped are black
// regardless of invert; escaped points scale linearly from [0, limit] to [0, 255].
inline uint8_t map_intensity(const EscapeResult& result, std::size_t limit, bool invert)
{
    if (!result)
        return 0;
    const std::size_t count = *result;
    const std::size_t v     = invert ? limit - count : count;
    return static_cast<uint8_t>(map_ranges(v, 0, limit, 0, 255));
}

struct Rgb { uint8_t r, g, b; };

// Colour for a raw iteration count from the count renderer. Counts above
// max_iter mark points that never escaped and come out white.
Rgb count_color(std::size_t count, std::size_t max_iter);

// Count buffer value for a point that never escaped.
inline std::size_t count_sentinel(std::size_t max_iter) { return max_iter + 1; }
