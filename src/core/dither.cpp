#include "core/dither.h"

#include <utility>
#include <vector>

namespace inkcomp::dither
{
bool Threshold(const GrayImage& in, GrayImage& out, Error& err)
{
    err.Clear();
    if (!in.Valid())
        return err.Set(ErrorKind::InvalidInput, "Threshold dither needs a non-empty 2D grid.");

    GrayImage result(in.width, in.height);
    for (size_t i = 0; i < in.pixels.size(); ++i)
        result.pixels[i] = (in.pixels[i] > 128) ? 255 : 0;
    out = std::move(result);
    return true;
}

bool FloydSteinberg(const GrayImage& in, GrayImage& out, Error& err)
{
    err.Clear();
    if (!in.Valid())
        return err.Set(ErrorKind::InvalidInput, "Error-diffusion dither needs a non-empty 2D grid.");

    const int w = in.width;
    const int h = in.height;

    // Working buffer: later pixels must see the error pushed by earlier ones.
    std::vector<float> work(in.pixels.begin(), in.pixels.end());
    GrayImage result(w, h);

    for (int y = 0; y < h; ++y)
    {
        float* row = &work[(size_t)y * (size_t)w];
        float* next = (y + 1 < h) ? &work[(size_t)(y + 1) * (size_t)w] : nullptr;
        for (int x = 0; x < w; ++x)
        {
            const float value = row[x];
            const float quant = (value >= 128.0f) ? 255.0f : 0.0f;
            result.pixels[(size_t)y * (size_t)w + (size_t)x] = (std::uint8_t)quant;

            const float e = value - quant;
            if (x + 1 < w)
                row[x + 1] += e * (7.0f / 16.0f);
            if (next)
            {
                if (x > 0)
                    next[x - 1] += e * (3.0f / 16.0f);
                next[x] += e * (5.0f / 16.0f);
                if (x + 1 < w)
                    next[x + 1] += e * (1.0f / 16.0f);
            }
        }
    }

    out = std::move(result);
    return true;
}

bool Apply(DitherMode mode, const GrayImage& in, GrayImage& out, Error& err)
{
    switch (mode)
    {
        case DitherMode::FloydSteinberg: return FloydSteinberg(in, out, err);
        case DitherMode::Threshold:      return Threshold(in, out, err);
        case DitherMode::None:           break;
    }
    err.Clear();
    if (&out != &in)
        out = in;
    return true;
}
} // namespace inkcomp::dither
