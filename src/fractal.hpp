#pragma once

#include <cmath>
#include <cstddef>
#include <optional>

#include "geometry.hpp"
#include "view_state.hpp"

// Number of iterations before |z|^2 passed the escape threshold, or empty
// if the orbit stayed bounded for the whole iteration budget.
using EscapeResult = std::optional<std::size_t>;

// Escape radius squared. Burning Ship always uses the canonical 4; Classic
// defaults to it and can be switched to 32 (--escape-norm) to reproduce the
// older reference renders.
constexpr double CANONICAL_ESCAPE_NORM = 4.0;
constexpr double REFERENCE_ESCAPE_NORM = 32.0;

// Shared escape loop. z0 = 0; at step i the orbit escapes if |z_i|^2 > escape_norm.
// IsBurningShip folds z onto (|Im z|, |Im z|) before squaring.
template<bool IsBurningShip>
inline EscapeResult escape_kernel(double cr, double ci, std::size_t limit, double escape_norm)
{
    double zr = 0.0;
    double zi = 0.0;
    for (std::size_t i = 0; i < limit; ++i) {
        if (zr*zr + zi*zi > escape_norm)
            return i;

        double new_zr, new_zi;
        if constexpr (IsBurningShip) {
            const double a = std::abs(zi);
            new_zr = a*a - a*a + cr;
            new_zi = 2.0*a*a + ci;
        } else {
            new_zr = zr*zr - zi*zi + cr;
            new_zi = 2.0*zr*zi + ci;
        }
        zr = new_zr;
        zi = new_zi;
    }
    return std::nullopt;
}

inline EscapeResult escape_time(Complex c, std::size_t limit,
                                double escape_norm = CANONICAL_ESCAPE_NORM)
    { return escape_kernel<false>(c.real(), c.imag(), limit, escape_norm); }

inline EscapeResult burning_ship(Complex c, std::size_t limit)
    { return escape_kernel<true>(c.real(), c.imag(), limit, CANONICAL_ESCAPE_NORM); }

// Per-pixel dispatch for callers outside the band loop. The renderer
// resolves the variant once per render instead.
inline EscapeResult compute_escape(AlgorithmType a, Complex c, std::size_t limit,
                                   double classic_norm = CANONICAL_ESCAPE_NORM)
{
    switch (a) {
        case AlgorithmType::BurningShip:
            return burning_ship(c, limit);
        case AlgorithmType::Classic:
        default:
            return escape_time(c, limit, classic_norm);
    }
}
