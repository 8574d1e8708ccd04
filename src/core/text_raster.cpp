#include "core/text_raster.h"

#include "core/fonts.h"

#include <algorithm>
#include <limits>

namespace inkcomp::text
{
std::u32string DecodeUtf8(std::string_view s)
{
    std::u32string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size())
    {
        const unsigned char c = (unsigned char)s[i];
        int len = 0;
        char32_t cp = 0;
        if (c < 0x80u)      { cp = c; len = 1; }
        else if ((c & 0xE0u) == 0xC0u) { cp = c & 0x1Fu; len = 2; }
        else if ((c & 0xF0u) == 0xE0u) { cp = c & 0x0Fu; len = 3; }
        else if ((c & 0xF8u) == 0xF0u) { cp = c & 0x07u; len = 4; }
        else
        {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        if (i + (size_t)len > s.size())
        {
            out.push_back(U'\uFFFD');
            break;
        }

        bool ok = true;
        for (int k = 1; k < len; ++k)
        {
            const unsigned char cc = (unsigned char)s[i + (size_t)k];
            if ((cc & 0xC0u) != 0x80u)
            {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if (!ok)
        {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
        i += (size_t)len;
    }
    return out;
}

TextExtent MeasureText(std::string_view text, int font_size)
{
    const long long scale = std::max(1, font_size);
    if (text.empty())
        return {};

    const std::u32string cps = DecodeUtf8(text);
    long long lines = 1;
    long long cur = 0;
    long long widest = 0;
    for (char32_t cp : cps)
    {
        if (cp == U'\n')
        {
            widest = std::max(widest, cur);
            cur = 0;
            ++lines;
            continue;
        }
        ++cur;
    }
    widest = std::max(widest, cur);

    const long long limit = std::numeric_limits<int>::max();
    TextExtent ext;
    // The trailing inter-character gap is not part of the extent.
    ext.width = (widest > 0) ? (int)std::min(limit, ((widest - 1) * fonts::kAdvance + fonts::kGlyphWidth) * scale) : 0;
    ext.height = (int)std::min(limit, ((lines - 1) * fonts::kLineAdvance + fonts::kGlyphHeight) * scale);
    return ext;
}

namespace
{
// Paint one scale x scale glyph cell, clipped to the canvas.
static void FillCell(GrayImage& canvas, long long x0, long long y0, long long size, std::uint8_t color)
{
    if (x0 >= canvas.width || y0 >= canvas.height || x0 + size <= 0 || y0 + size <= 0)
        return;
    const int cx0 = (int)std::max<long long>(0, x0);
    const int cy0 = (int)std::max<long long>(0, y0);
    const int cx1 = (int)std::min<long long>(canvas.width, x0 + size);
    const int cy1 = (int)std::min<long long>(canvas.height, y0 + size);
    for (int py = cy0; py < cy1; ++py)
        std::fill(&canvas.At(cx0, py), &canvas.At(cx0, py) + (cx1 - cx0), color);
}
} // namespace

void RenderText(std::string_view text, int x, int y, GrayImage& canvas, std::uint8_t color, int font_size)
{
    if (text.empty() || !canvas.Valid())
        return;

    const long long scale = std::max(1, font_size);
    const std::u32string cps = DecodeUtf8(text);

    long long pen_x = x;
    long long pen_y = y;
    for (char32_t cp : cps)
    {
        if (cp == U'\n')
        {
            pen_x = x;
            pen_y += fonts::kLineAdvance * scale;
            continue;
        }
        // Lines only move down.
        if (pen_y >= canvas.height)
            break;

        const bool visible = pen_x < canvas.width && pen_x + fonts::kGlyphWidth * scale > 0 &&
                             pen_y + fonts::kGlyphHeight * scale > 0;
        if (visible)
        {
            for (int col = 0; col < fonts::kGlyphWidth; ++col)
            {
                const std::uint8_t bits = fonts::GlyphColumnBits(cp, col);
                for (int row = 0; row < fonts::kGlyphHeight; ++row)
                {
                    if ((bits >> row) & 1u)
                        FillCell(canvas, pen_x + col * scale, pen_y + row * scale, scale, color);
                }
            }
        }
        pen_x += fonts::kAdvance * scale;
    }
}
} // namespace inkcomp::text
