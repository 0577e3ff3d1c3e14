#pragma once

#include <cstddef>
#include <string>

enum class AlgorithmType {
    Classic     = 0,  // z^2 + c, escape radius^2 configurable (default 4)
    BurningShip = 1,  // (|Im z| + i|Im z|)^2 + c, escape radius^2 = 4
};

// How the image is cut into horizontal bands.
enum class BandMode {
    PerRow    = 0,  // one row per band
    PerThread = 1,  // height / threads rows per band, last band takes the rest
};

// How bands reach the worker threads.
enum class Dispatch {
    Queued = 0,  // one pool task per band
    Cursor = 1,  // one task per worker, bands claimed from a shared cursor
};

enum class OutputFormat {
    Png = 0,
    Jxl = 1,
};

// Everything a render needs. Filled once from the command line and then
// only passed around by const reference.
struct ViewState {
    double        center_x    = 0.0;
    double        center_y    = 0.0;
    double        magnitude   = 4.0;    // side length of the square region
    int           width       = 1920;
    int           height      = 1080;
    std::size_t   max_iter    = 255;
    AlgorithmType algorithm   = AlgorithmType::Classic;
    double        escape_norm = 4.0;    // Classic only: |z|^2 escape threshold
    bool          invert      = false;
    int           threads     = 0;      // 0 = hardware concurrency
    BandMode      band_mode   = BandMode::PerRow;
    Dispatch      dispatch    = Dispatch::Queued;
    bool          color       = false;  // alternate RGB count renderer
    OutputFormat  format      = OutputFormat::Png;
    std::string   output      = "mandelbrot.png";
    bool          benchmark   = false;
    bool          verbose     = false;
};

inline const char* algorithm_name(AlgorithmType a)
{
    switch (a) {
        case AlgorithmType::Classic:     return "escape_time";
        case AlgorithmType::BurningShip: return "burning_ship";
    }
    return "unknown";
}

inline const char* band_mode_name(BandMode m)
{
    return m == BandMode::PerRow ? "row" : "thread";
}

inline const char* dispatch_name(Dispatch d)
{
    return d == Dispatch::Queued ? "queue" : "cursor";
}

// Unknown names fall back to Classic; *known is cleared so the caller can warn.
inline AlgorithmType parse_algorithm(const std::string& name, bool* known = nullptr)
{
    if (known) *known = true;
    if (name == "escape_time" || name == "classic" || name == "mandelbrot")
        return AlgorithmType::Classic;
    if (name == "burning_ship")
        return AlgorithmType::BurningShip;
    if (known) *known = false;
    return AlgorithmType::Classic;
}
