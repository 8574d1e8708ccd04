#include "core/bit_pack.h"

#include <string>
#include <utility>

namespace inkcomp::bit_pack
{
bool PackBits(const GrayImage& img, std::vector<std::uint8_t>& out, Error& err, const PackOptions& opt)
{
    err.Clear();
    out.clear();
    if (!img.Valid())
        return err.Set(ErrorKind::InvalidInput, "Cannot pack an empty pixel grid.");
    if (!img.IsBinary())
        return err.Set(ErrorKind::InvalidInput, "Bit packing needs a dithered (0/255) grid.");

    const size_t row_bytes = RowBytes(img.width);
    out.assign(row_bytes * (size_t)img.height, 0u);
    const bool white_one = opt.white_bit != 0;

    for (int y = 0; y < img.height; ++y)
    {
        std::uint8_t* dst = &out[(size_t)y * row_bytes];
        for (int x = 0; x < img.width; ++x)
        {
            const bool white = img.At(x, y) > 127;
            if (white == white_one)
                dst[x >> 3] |= (std::uint8_t)(0x80u >> (x & 7));
        }
    }
    return true;
}

bool UnpackBits(const std::vector<std::uint8_t>& bytes,
                int width,
                int height,
                GrayImage& out,
                Error& err,
                const PackOptions& opt)
{
    err.Clear();
    if (width <= 0 || height <= 0)
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Invalid packed size " + std::to_string(width) + "x" + std::to_string(height) + ".");
    }
    const size_t row_bytes = RowBytes(width);
    if (bytes.size() < row_bytes * (size_t)height)
        return err.Set(ErrorKind::InvalidInput, "Packed buffer is shorter than height * ceil(width / 8).");

    const bool white_one = opt.white_bit != 0;
    GrayImage img(width, height);
    for (int y = 0; y < height; ++y)
    {
        const std::uint8_t* src = &bytes[(size_t)y * row_bytes];
        for (int x = 0; x < width; ++x)
        {
            const bool bit = (src[x >> 3] & (0x80u >> (x & 7))) != 0;
            img.At(x, y) = (bit == white_one) ? 255 : 0;
        }
    }
    out = std::move(img);
    return true;
}
} // namespace inkcomp::bit_pack
