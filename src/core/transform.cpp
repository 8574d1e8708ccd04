#include "core/transform.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace inkcomp::transform
{
namespace
{
// Source index sampled by destination index `i` of `dst_n` (pixel-center mapping).
static int NearestIndex(long long i, long long dst_n, int src_n)
{
    const long long s = ((2LL * i + 1) * (long long)src_n) / (2LL * dst_n);
    return (int)std::min<long long>(s, src_n - 1);
}

// Nearest-neighbour resample sampling each destination pixel at its center.
static GrayImage ScaleNearest(const GrayImage& src, int dst_w, int dst_h)
{
    GrayImage out(dst_w, dst_h);
    std::vector<int> src_x((size_t)dst_w);
    for (int x = 0; x < dst_w; ++x)
        src_x[(size_t)x] = NearestIndex(x, dst_w, src.width);
    for (int y = 0; y < dst_h; ++y)
    {
        const std::uint8_t* srow = &src.pixels[(size_t)NearestIndex(y, dst_h, src.height) * (size_t)src.width];
        std::uint8_t* drow = &out.pixels[(size_t)y * (size_t)dst_w];
        for (int x = 0; x < dst_w; ++x)
            drow[x] = srow[src_x[(size_t)x]];
    }
    return out;
}

static long long ScaledExtent(int extent, double scale)
{
    return std::max(1LL, std::llround((double)extent * scale));
}
} // namespace

bool Resize(const GrayImage& src,
            int target_w,
            int target_h,
            ResizeMode mode,
            const CropAnchor& anchor,
            GrayImage& out,
            Error& err)
{
    err.Clear();
    if (target_w <= 0 || target_h <= 0)
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Invalid resize target " + std::to_string(target_w) + "x" + std::to_string(target_h) + ".");
    }
    if (!WithinPixelLimit(target_w, target_h))
    {
        return err.Set(ErrorKind::InvalidDimension,
                       "Resize target " + std::to_string(target_w) + "x" + std::to_string(target_h) +
                           " exceeds the pixel limit.");
    }
    if (!src.Valid())
        return err.Set(ErrorKind::InvalidInput, "Cannot resize an empty pixel grid.");

    switch (mode)
    {
        case ResizeMode::Stretch:
        {
            out = ScaleNearest(src, target_w, target_h);
            return true;
        }
        case ResizeMode::Fit:
        {
            const double scale = std::min((double)target_w / (double)src.width,
                                          (double)target_h / (double)src.height);
            const int nw = (int)std::min<long long>(target_w, ScaledExtent(src.width, scale));
            const int nh = (int)std::min<long long>(target_h, ScaledExtent(src.height, scale));
            const GrayImage scaled = ScaleNearest(src, nw, nh);

            out.Reset(target_w, target_h, 255);
            const int ox = (target_w - nw) / 2;
            const int oy = (target_h - nh) / 2;
            for (int y = 0; y < nh; ++y)
            {
                std::copy_n(&scaled.pixels[(size_t)y * (size_t)nw],
                            nw,
                            &out.pixels[(size_t)(y + oy) * (size_t)target_w + (size_t)ox]);
            }
            return true;
        }
        case ResizeMode::Crop:
        {
            const double scale = std::max((double)target_w / (double)src.width,
                                          (double)target_h / (double)src.height);
            const long long nw = std::max<long long>(target_w, ScaledExtent(src.width, scale));
            const long long nh = std::max<long long>(target_h, ScaledExtent(src.height, scale));
            if (nw > kMaxImagePixels || nh > kMaxImagePixels)
                return err.Set(ErrorKind::InvalidDimension, "Crop scale exceeds the pixel limit.");

            // Anchor is clamped so the window never leaves the scaled image.
            const long long max_x = nw - target_w;
            const long long max_y = nh - target_h;
            const long long cx = anchor.x ? std::clamp<long long>(*anchor.x, 0, max_x) : max_x / 2;
            const long long cy = anchor.y ? std::clamp<long long>(*anchor.y, 0, max_y) : max_y / 2;

            // Only the window is sampled; the scaled image is never materialized.
            std::vector<int> src_x((size_t)target_w);
            for (int x = 0; x < target_w; ++x)
                src_x[(size_t)x] = NearestIndex(cx + x, nw, src.width);

            out.Reset(target_w, target_h, 255);
            for (int y = 0; y < target_h; ++y)
            {
                const std::uint8_t* srow =
                    &src.pixels[(size_t)NearestIndex(cy + y, nh, src.height) * (size_t)src.width];
                std::uint8_t* drow = &out.pixels[(size_t)y * (size_t)target_w];
                for (int x = 0; x < target_w; ++x)
                    drow[x] = srow[src_x[(size_t)x]];
            }
            return true;
        }
    }
    return err.Set(ErrorKind::InvalidInput, "Unknown resize mode.");
}

GrayImage Rotate90Ccw(const GrayImage& src)
{
    if (!src.Valid())
        return {};

    // New grid is src.height wide and src.width tall.
    GrayImage out(src.height, src.width);
    for (int r = 0; r < out.height; ++r)
    {
        const int sc = src.width - 1 - r;
        for (int c = 0; c < out.width; ++c)
            out.At(c, r) = src.At(sc, c);
    }
    return out;
}

GrayImage RotateCcw(const GrayImage& src, int degrees)
{
    const int turns = (((degrees / 90) % 4) + 4) % 4;
    GrayImage out = src;
    for (int i = 0; i < turns; ++i)
        out = Rotate90Ccw(out);
    return out;
}

GrayImage FlipHorizontal(const GrayImage& src)
{
    GrayImage out = src;
    if (!out.Valid())
        return out;
    for (int y = 0; y < out.height; ++y)
    {
        auto row = out.pixels.begin() + (std::ptrdiff_t)y * out.width;
        std::reverse(row, row + out.width);
    }
    return out;
}

GrayImage FlipVertical(const GrayImage& src)
{
    GrayImage out = src;
    if (!out.Valid())
        return out;
    for (int y = 0; y < out.height / 2; ++y)
    {
        auto a = out.pixels.begin() + (std::ptrdiff_t)y * out.width;
        auto b = out.pixels.begin() + (std::ptrdiff_t)(out.height - 1 - y) * out.width;
        std::swap_ranges(a, a + out.width, b);
    }
    return out;
}

GrayImage Invert(const GrayImage& src)
{
    GrayImage out = src;
    for (std::uint8_t& v : out.pixels)
        v = (std::uint8_t)(255 - v);
    return out;
}

GrayImage AdjustBrightnessContrast(const GrayImage& src, float brightness, float contrast)
{
    GrayImage out = src;
    const float offset = contrast * 255.0f;
    for (std::uint8_t& v : out.pixels)
    {
        const float f = std::clamp((float)v * brightness + offset, 0.0f, 255.0f);
        v = (std::uint8_t)f;
    }
    return out;
}

GrayImage ApplyCanvasTransform(const GrayImage& src, CanvasTransform t)
{
    switch (t)
    {
        case CanvasTransform::FlipH:    return FlipHorizontal(src);
        case CanvasTransform::FlipV:    return FlipVertical(src);
        case CanvasTransform::Rotate90: return Rotate90Ccw(src);
        case CanvasTransform::Invert:   return Invert(src);
    }
    return src;
}
} // namespace inkcomp::transform
