#include "export.hpp"

#include <png.h>
#include <cstdio>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#include <vector>
#endif

namespace {

std::string check_buffer(const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Image has no pixels";
    if (buf.channels != 1 && buf.channels != 3)
        return "Unsupported channel count";
    if (buf.pixels.size() != static_cast<size_t>(buf.width) * buf.height * buf.channels)
        return "Pixel buffer size does not match its dimensions";
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// PNG export
//
// Rows are written straight from the buffer: one byte per pixel maps to
// PNG_COLOR_TYPE_GRAY, three bytes [R, G, B] to PNG_COLOR_TYPE_RGB.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    const std::string bad = check_buffer(buf);
    if (!bad.empty()) return bad;

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, buf.channels == 1 ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y)
        png_write_row(png, buf.row(y));

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless, 8-bit grey or RGB)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    const std::string bad = check_buffer(buf);
    if (!bad.empty()) return bad;

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    const bool grey = buf.channels == 1;

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                    = static_cast<uint32_t>(buf.width);
    bi.ysize                    = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample          = 8;
    bi.exponent_bits_per_sample = 0;
    bi.alpha_bits               = 0;
    bi.num_color_channels       = grey ? 1 : 3;
    bi.num_extra_channels       = 0;
    bi.uses_original_profile    = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, grey ? JXL_TRUE : JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {static_cast<uint32_t>(buf.channels), JXL_TYPE_UINT8,
                          JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.pixels.data(), buf.pixels.size())
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return std::string("Error writing file: ") + path;
    return {};  // success
}
#endif  // HAVE_JXL
