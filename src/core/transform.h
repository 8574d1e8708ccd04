// Geometric and tonal pixel-grid transforms.
// All functions are stateless; none of them modifies its input grid.
#pragma once

#include "core/error.h"
#include "core/gray_image.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace inkcomp::transform
{
enum class ResizeMode : std::uint8_t
{
    Stretch = 0, // exact target size, aspect not preserved
    Fit,         // aspect preserved, letterboxed on white
    Crop,        // aspect preserved, overflow cropped
};

inline constexpr const char* ResizeModeToString(ResizeMode m)
{
    switch (m)
    {
        case ResizeMode::Stretch: return "stretch";
        case ResizeMode::Fit:     return "fit";
        case ResizeMode::Crop:    return "crop";
    }
    return "fit";
}

inline bool ResizeModeFromString(std::string_view s, ResizeMode& out)
{
    if (s == "stretch") { out = ResizeMode::Stretch; return true; }
    if (s == "fit")     { out = ResizeMode::Fit; return true; }
    if (s == "crop")    { out = ResizeMode::Crop; return true; }
    return false;
}

// Top-left corner of the crop window, in scaled-image pixels.
// Either coordinate may be absent; an absent coordinate is centered.
struct CropAnchor
{
    std::optional<int> x;
    std::optional<int> y;
};

// Whole-canvas transforms accepted by the final transform pass.
enum class CanvasTransform : std::uint8_t
{
    FlipH = 0,
    FlipV,
    Rotate90,
    Invert,
};

inline constexpr const char* CanvasTransformToString(CanvasTransform t)
{
    switch (t)
    {
        case CanvasTransform::FlipH:    return "flip-h";
        case CanvasTransform::FlipV:    return "flip-v";
        case CanvasTransform::Rotate90: return "rotate-90";
        case CanvasTransform::Invert:   return "invert";
    }
    return "flip-h";
}

inline bool CanvasTransformFromString(std::string_view s, CanvasTransform& out)
{
    if (s == "flip-h")    { out = CanvasTransform::FlipH; return true; }
    if (s == "flip-v")    { out = CanvasTransform::FlipV; return true; }
    if (s == "rotate-90") { out = CanvasTransform::Rotate90; return true; }
    if (s == "invert")    { out = CanvasTransform::Invert; return true; }
    return false;
}

// Resample `src` into a target_w x target_h grid using `mode` (nearest-neighbour sampling).
// Fails with InvalidDimension if target_w or target_h <= 0, InvalidInput if `src` is empty.
bool Resize(const GrayImage& src,
            int target_w,
            int target_h,
            ResizeMode mode,
            const CropAnchor& anchor,
            GrayImage& out,
            Error& err);

// One counter-clockwise quarter turn: out(row, col) = src(row=col, col=src.width-1-row).
GrayImage Rotate90Ccw(const GrayImage& src);

// Counter-clockwise rotation by any multiple of 90 degrees (negative values rotate clockwise).
GrayImage RotateCcw(const GrayImage& src, int degrees);

GrayImage FlipHorizontal(const GrayImage& src);
GrayImage FlipVertical(const GrayImage& src);

// pixel -> 255 - pixel
GrayImage Invert(const GrayImage& src);

// pixel -> clamp(pixel * brightness + contrast * 255, 0, 255), truncated toward zero.
GrayImage AdjustBrightnessContrast(const GrayImage& src, float brightness, float contrast);

// Apply one whole-canvas transform.
GrayImage ApplyCanvasTransform(const GrayImage& src, CanvasTransform t);
} // namespace inkcomp::transform
