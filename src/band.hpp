#pragma once

#include <algorithm>
#include <vector>

#include "geometry.hpp"
#include "view_state.hpp"

// A contiguous run of image rows rendered by a single worker task.
// `region` is the slice of the complex plane those rows cover.
struct Band {
    int           first_row = 0;
    int           rows      = 0;
    ComplexRegion region;
};

// Rows per band for the given mode. PerThread never returns less than 1.
inline int rows_per_band(BandMode mode, int height, int threads)
{
    if (mode == BandMode::PerRow || threads < 1)
        return 1;
    return std::max(1, height / threads);
}

// Split [0, dims.height) into bands of `rows` rows; the last band absorbs
// any remainder. Bands are returned top to bottom, never overlap, and cover
// every row exactly once.
inline std::vector<Band> plan_bands(Dimensions dims, const ComplexRegion& region, int rows)
{
    std::vector<Band> bands;
    if (dims.width <= 0 || dims.height <= 0)
        return bands;
    if (rows < 1) rows = 1;

    const int count = std::max(1, dims.height / rows);
    bands.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i) {
        Band b;
        b.first_row = i * rows;
        b.rows      = (i == count - 1) ? dims.height - b.first_row : rows;
        b.region.upper_left  = pixel_to_point(dims, {0, b.first_row}, region);
        b.region.lower_right = pixel_to_point(dims, {dims.width, b.first_row + b.rows}, region);
        bands.push_back(b);
    }
    return bands;
}
