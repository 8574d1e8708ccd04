#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace inkcomp
{
// Largest grid any operation will allocate (256 MiB of 8-bit samples).
inline constexpr long long kMaxImagePixels = 1LL << 28;

// True when a w x h grid is non-empty and within kMaxImagePixels.
inline bool WithinPixelLimit(long long w, long long h)
{
    return w > 0 && h > 0 && w <= kMaxImagePixels && h <= kMaxImagePixels && w * h <= kMaxImagePixels;
}

// 8-bit grayscale pixel grid, row-major. 0 = black, 255 = white.
struct GrayImage
{
    int                       width = 0;
    int                       height = 0;
    std::vector<std::uint8_t> pixels; // width * height bytes

    GrayImage() = default;
    GrayImage(int w, int h, std::uint8_t fill = 255) { Reset(w, h, fill); }

    void Reset(int w, int h, std::uint8_t fill = 255)
    {
        width = (w > 0 && h > 0) ? w : 0;
        height = (w > 0 && h > 0) ? h : 0;
        pixels.assign((size_t)width * (size_t)height, fill);
    }

    // A grid is usable by transforms only when it is 2D, non-empty and its buffer matches its shape.
    bool Valid() const
    {
        return width > 0 && height > 0 && pixels.size() == (size_t)width * (size_t)height;
    }

    bool Empty() const { return width <= 0 || height <= 0; }

    std::uint8_t At(int x, int y) const { return pixels[(size_t)y * (size_t)width + (size_t)x]; }
    std::uint8_t& At(int x, int y) { return pixels[(size_t)y * (size_t)width + (size_t)x]; }

    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }

    void Fill(std::uint8_t v) { std::fill(pixels.begin(), pixels.end(), v); }

    // True when every pixel is either 0 or 255.
    bool IsBinary() const;

    bool operator==(const GrayImage& o) const
    {
        return width == o.width && height == o.height && pixels == o.pixels;
    }
    bool operator!=(const GrayImage& o) const { return !(*this == o); }
};
} // namespace inkcomp
