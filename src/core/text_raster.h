#pragma once

#include "core/gray_image.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace inkcomp::text
{
// Largest glyph scale a text layer accepts.
inline constexpr int kMaxFontSize = 64;

struct TextExtent
{
    int width = 0;
    int height = 0;
};

// Decode UTF-8 into code points. Malformed sequences become U+FFFD (drawn as the placeholder glyph).
std::u32string DecodeUtf8(std::string_view s);

// Pixel extent of `text` rendered at `font_size` (integer glyph scale, clamped to >= 1).
// '\n' starts a new line. Empty text measures 0x0; extents saturate at INT_MAX.
TextExtent MeasureText(std::string_view text, int font_size = 1);

// Draw `text` with its top-left glyph origin at (x, y). Ink pixels are set to `color`;
// background pixels are left untouched. Pixels outside `canvas` are clipped silently.
void RenderText(std::string_view text, int x, int y, GrayImage& canvas, std::uint8_t color, int font_size = 1);
} // namespace inkcomp::text
