#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct ViewState;

// Pixel buffer: row-major, `channels` bytes per pixel (1 = grey, 3 = RGB).
struct PixelBuffer {
    std::vector<uint8_t> pixels;
    int width    = 0;
    int height   = 0;
    int channels = 1;

    void resize(int w, int h, int ch = 1)
    {
        width    = w;
        height   = h;
        channels = ch;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h)
                          * static_cast<size_t>(ch), 0);
    }

    uint8_t* row(int y)
    {
        return pixels.data() + static_cast<size_t>(y) * width * channels;
    }
    const uint8_t* row(int y) const
    {
        return pixels.data() + static_cast<size_t>(y) * width * channels;
    }
};

class IFractalRenderer {
public:
    virtual ~IFractalRenderer() = default;
    virtual void render(const ViewState& state, PixelBuffer& buf) = 0;
};
