#pragma once

#include <cstdint>

// Built-in fixed-size bitmap font used by text layers.
//
// Glyph format:
// - printable ASCII 0x20..0x7E, one glyph per code point
// - 5 columns per glyph, one byte per column (column-major)
// - bit 0 is the top row, bit 7 the bottom row (8 rows; row 7 holds descenders)
namespace inkcomp::fonts
{
inline constexpr int kGlyphWidth = 5;
inline constexpr int kGlyphHeight = 8;

// Horizontal distance between consecutive glyph origins (glyph + 1px gap).
inline constexpr int kAdvance = 6;

// Vertical distance between consecutive text lines.
inline constexpr int kLineAdvance = 10;

inline constexpr char32_t kFirstGlyph = U' ';
inline constexpr char32_t kLastGlyph = U'~';

// True when `cp` has its own glyph (otherwise the placeholder box is drawn).
bool HasGlyph(char32_t cp);

// Column bits for `cp` (placeholder box when the font has no glyph for it).
// `col` outside [0, kGlyphWidth) yields 0.
std::uint8_t GlyphColumnBits(char32_t cp, int col);

// True when pixel (col, row) of `cp`'s glyph is ink.
inline bool GlyphPixel(char32_t cp, int col, int row)
{
    if (row < 0 || row >= kGlyphHeight)
        return false;
    return (GlyphColumnBits(cp, col) >> row) & 1u;
}
} // namespace inkcomp::fonts
