#pragma once

#include "core/bit_pack.h"
#include "core/error.h"
#include "core/gray_image.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace inkcomp::image_writer
{
enum class OutputFormat : std::uint8_t
{
    Png = 0, // 8-bit grayscale PNG (lodepng)
    Bmp,     // black/white 24-bpp BMP (stb_image_write), thresholded at > 128
    Binary,  // packed 1bpp panel bytes
};

inline constexpr const char* OutputFormatToString(OutputFormat f)
{
    switch (f)
    {
        case OutputFormat::Png:    return "png";
        case OutputFormat::Bmp:    return "bmp";
        case OutputFormat::Binary: return "bin";
    }
    return "png";
}

inline bool OutputFormatFromString(std::string_view s, OutputFormat& out)
{
    if (s == "png")                   { out = OutputFormat::Png; return true; }
    if (s == "bmp")                   { out = OutputFormat::Bmp; return true; }
    if (s == "bin" || s == "binary") { out = OutputFormat::Binary; return true; }
    return false;
}

// Guess the format from a file extension (".png", ".bmp", ".bin"); false if unknown.
bool OutputFormatFromPath(const std::string& path, OutputFormat& out);

// Encode `img` as an 8-bit grayscale PNG in memory.
bool EncodePngGray8(const GrayImage& img, std::vector<std::uint8_t>& out, Error& err, int compression = 6);

bool WritePngGray8(const std::string& path, const GrayImage& img, Error& err, int compression = 6);

// Every pixel is reduced to pure black/white (> 128 -> white) before writing.
// The file is a 24-bpp BMP (stb_image_write has no 1-bpp mode) whose pixels are only
// ever 0,0,0 or 255,255,255.
bool WriteBmpMono(const std::string& path, const GrayImage& img, Error& err);

bool WriteBinary(const std::string& path, const std::vector<std::uint8_t>& bytes, Error& err);
} // namespace inkcomp::image_writer
