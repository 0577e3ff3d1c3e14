#include <doctest/doctest.h>

#include "export.hpp"

#include <png.h>

#ifdef HAVE_JXL
#include <jxl/decode.h>
#endif

#include <cstdio>
#include <string>
#include <vector>

namespace {

std::string temp_path(const char* name)
{
  return std::string(P_tmpdir) + "/fractal_render_test_" + name;
}

// Reads a PNG back with libpng's simplified API.
bool read_png(const std::string& path, png_uint_32 format, int& w, int& h,
              std::vector<uint8_t>& pixels)
{
  png_image image{};
  image.version = PNG_IMAGE_VERSION;
  if (!png_image_begin_read_from_file(&image, path.c_str()))
    return false;
  image.format = format;
  pixels.resize(PNG_IMAGE_SIZE(image));
  if (!png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr)) {
    png_image_free(&image);
    return false;
  }
  w = static_cast<int>(image.width);
  h = static_cast<int>(image.height);
  return true;
}

#ifdef HAVE_JXL
// Decodes a JPEG XL file into 8-bit samples with the given channel count.
bool read_jxl(const std::string& path, uint32_t channels, int& w, int& h,
              std::vector<uint8_t>& pixels)
{
  FILE* fp = std::fopen(path.c_str(), "rb");
  if (!fp) return false;
  std::vector<uint8_t> data;
  uint8_t chunk[4096];
  size_t n;
  while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0)
    data.insert(data.end(), chunk, chunk + n);
  std::fclose(fp);

  JxlDecoder* dec = JxlDecoderCreate(nullptr);
  if (!dec) return false;
  bool ok = JxlDecoderSubscribeEvents(dec, JXL_DEC_BASIC_INFO | JXL_DEC_FULL_IMAGE)
                == JXL_DEC_SUCCESS
         && JxlDecoderSetInput(dec, data.data(), data.size()) == JXL_DEC_SUCCESS;
  if (ok) JxlDecoderCloseInput(dec);

  const JxlPixelFormat fmt = {channels, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
  bool done = false;
  while (ok && !done) {
    switch (JxlDecoderProcessInput(dec)) {
      case JXL_DEC_BASIC_INFO: {
        JxlBasicInfo info;
        ok = JxlDecoderGetBasicInfo(dec, &info) == JXL_DEC_SUCCESS;
        if (ok) {
          w = static_cast<int>(info.xsize);
          h = static_cast<int>(info.ysize);
        }
        break;
      }
      case JXL_DEC_NEED_IMAGE_OUT_BUFFER: {
        size_t size = 0;
        ok = JxlDecoderImageOutBufferSize(dec, &fmt, &size) == JXL_DEC_SUCCESS;
        if (ok) {
          pixels.resize(size);
          ok = JxlDecoderSetImageOutBuffer(dec, &fmt, pixels.data(), pixels.size())
               == JXL_DEC_SUCCESS;
        }
        break;
      }
      case JXL_DEC_FULL_IMAGE:
        break;
      case JXL_DEC_SUCCESS:
        done = true;
        break;
      default:
        ok = false;
        break;
    }
  }
  JxlDecoderDestroy(dec);
  return ok && done;
}
#endif  // HAVE_JXL

}  // namespace

TEST_CASE("export_png: greyscale buffer") {
  PixelBuffer buf;
  buf.resize(5, 3);
  for (size_t i = 0; i < buf.pixels.size(); ++i)
    buf.pixels[i] = static_cast<uint8_t>(i * 17);

  const std::string path = temp_path("grey.png");
  REQUIRE(export_png(path.c_str(), buf).empty());

  int w = 0, h = 0;
  std::vector<uint8_t> back;
  REQUIRE(read_png(path, PNG_FORMAT_GRAY, w, h, back));
  CHECK(w == 5);
  CHECK(h == 3);
  CHECK(back == buf.pixels);
  std::remove(path.c_str());
}

TEST_CASE("export_png: RGB buffer") {
  PixelBuffer buf;
  buf.resize(4, 2, 3);
  for (size_t i = 0; i < buf.pixels.size(); ++i)
    buf.pixels[i] = static_cast<uint8_t>(255 - i * 9);

  const std::string path = temp_path("rgb.png");
  REQUIRE(export_png(path.c_str(), buf).empty());

  int w = 0, h = 0;
  std::vector<uint8_t> back;
  REQUIRE(read_png(path, PNG_FORMAT_RGB, w, h, back));
  CHECK(w == 4);
  CHECK(h == 2);
  CHECK(back == buf.pixels);
  std::remove(path.c_str());
}

TEST_CASE("export_png: errors are reported, not thrown") {
  PixelBuffer empty;
  CHECK_FALSE(export_png(temp_path("empty.png").c_str(), empty).empty());

  PixelBuffer buf;
  buf.resize(2, 2);
  CHECK_FALSE(export_png("/nonexistent-dir/fractal.png", buf).empty());

  buf.pixels.pop_back();
  CHECK_FALSE(export_png(temp_path("short.png").c_str(), buf).empty());
}

#ifdef HAVE_JXL
TEST_CASE("export_jxl: greyscale buffer is lossless") {
  PixelBuffer buf;
  buf.resize(7, 5);
  for (size_t i = 0; i < buf.pixels.size(); ++i)
    buf.pixels[i] = static_cast<uint8_t>(i * 7);

  const std::string path = temp_path("grey.jxl");
  REQUIRE(export_jxl(path.c_str(), buf).empty());

  int w = 0, h = 0;
  std::vector<uint8_t> back;
  REQUIRE(read_jxl(path, 1, w, h, back));
  CHECK(w == 7);
  CHECK(h == 5);
  CHECK(back == buf.pixels);
  std::remove(path.c_str());
}

TEST_CASE("export_jxl: RGB buffer is lossless") {
  PixelBuffer buf;
  buf.resize(6, 4, 3);
  for (size_t i = 0; i < buf.pixels.size(); ++i)
    buf.pixels[i] = static_cast<uint8_t>(250 - i * 3);

  const std::string path = temp_path("rgb.jxl");
  REQUIRE(export_jxl(path.c_str(), buf).empty());

  int w = 0, h = 0;
  std::vector<uint8_t> back;
  REQUIRE(read_jxl(path, 3, w, h, back));
  CHECK(w == 6);
  CHECK(h == 4);
  CHECK(back == buf.pixels);
  std::remove(path.c_str());
}

TEST_CASE("export_jxl: errors are reported, not thrown") {
  PixelBuffer empty;
  CHECK_FALSE(export_jxl(temp_path("empty.jxl").c_str(), empty).empty());

  PixelBuffer buf;
  buf.resize(2, 2);
  CHECK_FALSE(export_jxl("/nonexistent-dir/fractal.jxl", buf).empty());
}
#endif  // HAVE_JXL

TEST_CASE("prefixed_filename") {
  CHECK(prefixed_filename("mandelbrot.png", "color_") == "color_mandelbrot.png");
  CHECK(prefixed_filename("out/m.png", "color_") == "out/color_m.png");
  CHECK(prefixed_filename("/tmp/a/b.png", "x_") == "/tmp/a/x_b.png");
}
