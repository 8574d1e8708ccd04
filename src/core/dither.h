// Grayscale -> binary (0/255) reducers.
#pragma once

#include "core/error.h"
#include "core/gray_image.h"

#include <cstdint>
#include <string_view>

namespace inkcomp::dither
{
enum class DitherMode : std::uint8_t
{
    None = 0,
    FloydSteinberg, // error diffusion
    Threshold,
};

inline constexpr const char* DitherModeToString(DitherMode m)
{
    switch (m)
    {
        case DitherMode::None:           return "none";
        case DitherMode::FloydSteinberg: return "floyd-steinberg";
        case DitherMode::Threshold:      return "threshold";
    }
    return "none";
}

inline bool DitherModeFromString(std::string_view s, DitherMode& out)
{
    // Accept a few common spellings.
    if (s == "none" || s.empty()) { out = DitherMode::None; return true; }
    if (s == "floyd-steinberg" || s == "floyd_steinberg" || s == "error-diffusion" || s == "fs")
    {
        out = DitherMode::FloydSteinberg;
        return true;
    }
    if (s == "threshold") { out = DitherMode::Threshold; return true; }
    return false;
}

// pixel -> 255 if pixel > 128 else 0.
bool Threshold(const GrayImage& in, GrayImage& out, Error& err);

// Floyd-Steinberg error diffusion, straight row-major scan (no serpentine).
// A pixel becomes 255 when its accumulated value is >= 128. Error is pushed
// 7/16 east, 3/16 south-west, 5/16 south, 1/16 south-east; weights that would
// land outside the grid are dropped.
bool FloydSteinberg(const GrayImage& in, GrayImage& out, Error& err);

// Dispatch on `mode`. DitherMode::None copies the input unchanged.
bool Apply(DitherMode mode, const GrayImage& in, GrayImage& out, Error& err);
} // namespace inkcomp::dither
