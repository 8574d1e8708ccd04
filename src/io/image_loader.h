#pragma once

#include "core/error.h"
#include "core/gray_image.h"

#include <cstdint>
#include <string>
#include <vector>

namespace inkcomp::image_loader
{
// Load an image from disk into an 8-bit grayscale grid using stb_image.
// - supports common formats (PNG/JPG/GIF/BMP/...)
// - colour input is reduced to luma by stb; alpha is composited over white
// - fails with LoadError if the file is missing or cannot be decoded
bool LoadImageAsGray8(const std::string& path, GrayImage& out, Error& err);

// Decode an in-memory encoded image (PNG/JPG/GIF/BMP/etc) into an 8-bit grayscale grid.
bool LoadImageFromMemoryAsGray8(const std::vector<std::uint8_t>& bytes, GrayImage& out, Error& err);
} // namespace inkcomp::image_loader
