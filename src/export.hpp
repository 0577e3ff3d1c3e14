#pragma once

#include "renderer.hpp"

#include <string>

// Write an 8-bit greyscale (channels == 1) or RGB (channels == 3) image.
// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// "dir/name.png" + "color_" -> "dir/color_name.png"
inline std::string prefixed_filename(const std::string& path, const std::string& prefix)
{
    const std::string::size_type slash = path.find_last_of('/');
    if (slash == std::string::npos)
        return prefix + path;
    return path.substr(0, slash + 1) + prefix + path.substr(slash + 1);
}
