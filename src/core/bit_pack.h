// 1-bit-per-pixel packing for panel transfer.
#pragma once

#include "core/error.h"
#include "core/gray_image.h"

#include <cstdint>
#include <vector>

namespace inkcomp::bit_pack
{
struct PackOptions
{
    // Bit value written for a white pixel (pixel > 127). Panels differ in polarity;
    // the default matches "1 = white".
    int white_bit = 1;
};

// Bytes per packed row: ceil(width / 8).
inline size_t RowBytes(int width)
{
    return (width > 0) ? ((size_t)width + 7u) / 8u : 0u;
}

// Pack 8 horizontal pixels per byte, MSB first, row-major; each row is padded
// with zero bits to a byte boundary. Output length is height * ceil(width / 8).
// Fails with InvalidInput unless `img` is non-empty and strictly 0/255.
bool PackBits(const GrayImage& img,
              std::vector<std::uint8_t>& out,
              Error& err,
              const PackOptions& opt = {});

// Inverse of PackBits. Fails with InvalidDimension on a non-positive size and
// InvalidInput when `bytes` is shorter than height * ceil(width / 8).
bool UnpackBits(const std::vector<std::uint8_t>& bytes,
                int width,
                int height,
                GrayImage& out,
                Error& err,
                const PackOptions& opt = {});
} // namespace inkcomp::bit_pack
